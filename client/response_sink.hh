#pragma once
#include "network_fwd.hh"
#include "client/headers.hh"
#include <optional>
#include <string_view>

namespace courier {

// Outbound responder a streamed response can be forwarded to
class response_sink {
public:
  virtual ~response_sink() = default;

  // `content_length` is set when the size of the body is known up front
  virtual auto send_head(const status& code, const header_map& headers,
                         std::optional<std::size_t> content_length) -> awaitable<void> = 0;
  virtual auto send_chunk(std::string_view data) -> awaitable<void> = 0;
  virtual auto finish() -> awaitable<void> = 0;
};

// Writes an HTTP/1.1 response to a connected socket. The body is sent with
// a Content-Length when it is known, with chunked transfer coding otherwise.
class tcp_response_sink : public response_sink {
public:
  explicit tcp_response_sink(tcp::socket& peer);

  auto send_head(const status& code, const header_map& headers,
                 std::optional<std::size_t> content_length) -> awaitable<void> override;
  auto send_chunk(std::string_view data) -> awaitable<void> override;
  auto finish() -> awaitable<void> override;

  auto bytes_sent() const -> std::size_t {
    return sent;
  }

private:
  tcp::socket& peer;
  bool chunked{false};
  bool head_sent{false};
  std::size_t sent{0};
};

}	// end of namespace courier
