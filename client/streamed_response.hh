#pragma once
#include "network_fwd.hh"
#include "client/buffer_pool.hh"
#include "client/headers.hh"
#include "client/request_executor.hh"
#include "client/response_sink.hh"
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <optional>

namespace courier {

// The body of a streamed response: a single pass, finite sequence of
// chunks, read from the socket only when the consumer asks for the next
// one. Reaching the end hands the connection back to the pool; cancelling
// (or destroying the stream early) closes it.
//
// One consumer at a time: do not ask for the next chunk before the previous
// request completed. The stream must not outlive the client it came from.
class body_stream {
public:
  body_stream() = default;
  explicit body_stream(exchange ex);
  body_stream(body_stream&&) noexcept = default;
  body_stream& operator = (body_stream&& other) noexcept;
  body_stream(const body_stream&) = delete;
  body_stream& operator = (const body_stream&) = delete;
  ~body_stream();

  // Next chunk, an empty optional at the end of the body. Fails with
  // client_error(cancelled) after cancel().
  auto async_next() -> awaitable<std::optional<pooled_buffer>>;
  auto next() -> std::future<std::optional<pooled_buffer>>;

  void cancel();
  auto finished() const -> bool;

private:
  struct state;
  static auto pull(std::shared_ptr<state> st) -> awaitable<std::optional<pooled_buffer>>;
  static void finish(state& st, bool complete);

  std::shared_ptr<state> shared;
};

class streamed_response {
public:
  using header_action = std::function<void(header_map&)>;

  streamed_response() = default;
  explicit streamed_response(exchange ex);

  auto get_status() const -> const status& {
    return code;
  }
  auto status_code() const -> unsigned int {
    return code.code;
  }
  auto headers() const -> const header_map& {
    return fields;
  }
  auto content_type() const -> const media_type& {
    return media;
  }
  // Body size announced by the server, if it did
  auto content_length() const -> std::optional<std::size_t> {
    return length;
  }
  auto body() -> body_stream& {
    return stream;
  }

  // Copy status, headers and body to `sink` without buffering the body.
  // Hop-by-hop headers are dropped; `adjust` may change the outgoing headers
  // before they are sent. A failing sink cancels the body.
  auto forward_to(response_sink& sink, header_action adjust = {}) -> awaitable<void>;

private:
  status code;
  header_map fields;
  media_type media;
  std::optional<std::size_t> length;
  body_stream stream;
};

}	// end of namespace courier
