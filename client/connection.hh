#pragma once
#include "network_fwd.hh"
#include "client/buffer_pool.hh"
#include "client/errors.hh"
#include "client/http_codec.hh"
#include "client/uri.hh"
#include <chrono>
#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace courier {

// Connections are only reused between requests with the same key
struct pool_key {
  std::string scheme;
  std::string host;
  std::uint16_t port{0};

  static auto of(const uri& target) -> pool_key;

  auto secure() const -> bool {
    return scheme == "https";
  }
  auto to_string() const -> std::string;
};

auto operator == (const pool_key& left, const pool_key& right) -> bool;
auto operator != (const pool_key& left, const pool_key& right) -> bool;
auto operator < (const pool_key& left, const pool_key& right) -> bool;
auto operator << (std::ostream& os, const pool_key& key) -> std::ostream&;

struct pool_key_hash {
  auto operator () (const pool_key& key) const -> std::size_t;
};

// One TCP (optionally TLS) connection speaking HTTP/1.1. A connection
// carries at most one exchange at a time; reads and writes are strictly
// sequential. All member functions must run on the connection's executor.
class connection : public std::enable_shared_from_this<connection> {
public:
  enum class state {
    idle,
    active,
    closing,
    closed
  };

  connection(asio::any_io_executor executor, ssl::context& tls, pool_key key,
             std::uint64_t id, std::shared_ptr<buffer_pool> buffers);
  ~connection();

  connection(const connection&) = delete;
  connection& operator = (const connection&) = delete;

  // Resolve, connect and (for https) run the TLS handshake. Throws
  // client_error(connect_error), or the abort reason when aborted.
  auto connect(std::chrono::milliseconds timeout, bool verify_peer) -> awaitable<void>;

  // Prepare for a new exchange on this connection
  void begin_exchange();

  // Gathered write of up to three pieces
  auto write(std::string_view first, std::string_view second = {}, std::string_view third = {}) -> awaitable<void>;

  // Read the next final response head (interim 1xx responses are skipped)
  // and set up the body framing for `method`.
  auto read_head(std::string_view method) -> awaitable<response_head>;

  // Next piece of the response body, an empty optional once the body ended
  auto read_body() -> awaitable<std::optional<pooled_buffer>>;

  // Close the socket; operations in progress fail with `reason`
  void abort(client_errc reason);
  void close();

  // Idle health check: still open and not half-closed by the peer
  auto alive_when_idle() -> bool;

  // The body was read completely and both sides agreed to keep the
  // connection open.
  auto reusable() const -> bool;
  auto body_complete() const -> bool {
    return complete;
  }
  auto framing() const -> const body_framing& {
    return frame;
  }

  auto current_state() const -> state {
    return status;
  }
  void set_state(state s);
  auto is_open() const -> bool;
  auto key() const -> const pool_key& {
    return where;
  }
  auto id() const -> std::uint64_t {
    return ident;
  }
  auto idle_since() const -> clock_type::time_point {
    return idle_at;
  }
  auto exchanges() const -> std::size_t {
    return served;
  }
  auto executor() const -> asio::any_io_executor {
    return ex;
  }

private:
  auto read_some(asio::mutable_buffer into) -> awaitable<std::size_t>;
  auto fill(char* into, std::size_t size) -> awaitable<std::size_t>;
  auto read_line() -> awaitable<std::string>;
  auto read_chunked() -> awaitable<std::optional<pooled_buffer>>;
  [[noreturn]] void fail(const boost::system::error_code& ec, bool connecting);
  [[noreturn]] void fail_with(client_errc reason, const std::string& what);

  enum class chunk_step {
    size_line,
    data,
    data_end,
    trailers,
    done
  };

  asio::any_io_executor ex;
  tls_stream stream;
  tcp::resolver resolver;
  pool_key where;
  std::uint64_t ident;
  std::shared_ptr<buffer_pool> buffers;

  state status{state::idle};
  clock_type::time_point idle_at{clock_type::now()};
  std::size_t served{0};

  std::string inbuf;
  bool peer_eof{false};
  body_framing frame;
  std::size_t remaining{0};
  chunk_step step{chunk_step::size_line};
  bool keep{false};
  bool complete{false};
  bool broken{false};
  std::optional<client_errc> aborted;
};

auto to_string(connection::state s) -> const char*;

}	// end of namespace courier
