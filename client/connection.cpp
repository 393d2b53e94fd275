#include "client/connection.hh"
#include "log/logging.hh"
#include <boost/functional/hash.hpp>
#include <array>
#include <ostream>
#include <tuple>

namespace courier {
namespace {

// "[::1]" -> "::1", the resolver wants the bare address
auto bare_host(const std::string& host) -> std::string {
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
    return host.substr(1, host.size() - 2);
  }
  return host;
}

auto or_aborted(const boost::system::error_code& ec) -> boost::system::error_code {
  if (ec) {
    return ec;
  }
  return asio::error::operation_aborted;
}

auto is_ip_literal(const std::string& host) -> bool {
  boost::system::error_code ec;
  asio::ip::make_address(host, ec);
  return !ec;
}

}		// end of local namespace

auto pool_key::of(const uri& target) -> pool_key {
  return {target.scheme, target.host, target.port};
}

auto pool_key::to_string() const -> std::string {
  return scheme + "://" + host + ":" + std::to_string(port);
}

auto operator == (const pool_key& left, const pool_key& right) -> bool {
  return left.port == right.port && left.host == right.host && left.scheme == right.scheme;
}

auto operator != (const pool_key& left, const pool_key& right) -> bool {
  return !(left == right);
}

auto operator < (const pool_key& left, const pool_key& right) -> bool {
  return std::tie(left.scheme, left.host, left.port) < std::tie(right.scheme, right.host, right.port);
}

auto operator << (std::ostream& os, const pool_key& key) -> std::ostream& {
  return os << key.to_string();
}

auto pool_key_hash::operator () (const pool_key& key) const -> std::size_t {
  std::size_t seed{0};
  boost::hash_combine(seed, key.scheme);
  boost::hash_combine(seed, key.host);
  boost::hash_combine(seed, key.port);
  return seed;
}

auto to_string(connection::state s) -> const char* {
  switch (s) {
    case connection::state::idle:
      return "idle";
    case connection::state::active:
      return "active";
    case connection::state::closing:
      return "closing";
    case connection::state::closed:
      return "closed";
  }
  return "unknown";
}

connection::connection(asio::any_io_executor executor, ssl::context& tls, pool_key key,
                       std::uint64_t id, std::shared_ptr<buffer_pool> b) :
    ex{executor}, stream{executor, tls}, resolver{executor}, where{std::move(key)},
    ident{id}, buffers{std::move(b)} {
}

connection::~connection() {
  close();
}

auto connection::connect(std::chrono::milliseconds timeout, bool verify_peer) -> awaitable<void> {
  status = state::active;
  const auto host{bare_host(where.host)};

  asio::steady_timer timer{ex};
  timer.expires_after(timeout);
  std::weak_ptr<connection> weak{shared_from_this()};
  auto pending{std::make_shared<bool>(true)};
  timer.async_wait([weak, pending](const boost::system::error_code& ec) {
    if (!ec && *pending) {
      if (auto self = weak.lock(); self && !self->aborted) {
        LOG(WARNING) << "connect to " << self->where << " timed out" << ENDL;
        self->abort(client_errc::connect_error);
      }
    }
  });

  boost::system::error_code ec;
  auto endpoints = co_await resolver.async_resolve(host, std::to_string(where.port),
                                                   asio::redirect_error(use_awaitable, ec));
  if (ec || aborted) {
    fail(or_aborted(ec), true);
  }
  co_await asio::async_connect(stream.next_layer(), endpoints, asio::redirect_error(use_awaitable, ec));
  if (ec || aborted) {
    fail(or_aborted(ec), true);
  }
  boost::system::error_code ignored;
  stream.next_layer().set_option(tcp::no_delay(true), ignored);

  if (where.secure()) {
    if (!is_ip_literal(host)) {
      // SNI
      SSL_set_tlsext_host_name(stream.native_handle(), host.c_str());
    }
    if (verify_peer) {
      stream.set_verify_mode(ssl::verify_peer);
      stream.set_verify_callback(ssl::host_name_verification(host));
    } else {
      stream.set_verify_mode(ssl::verify_none);
    }
    co_await stream.async_handshake(ssl::stream_base::client, asio::redirect_error(use_awaitable, ec));
    if (ec || aborted) {
      fail(or_aborted(ec), true);
    }
  }
  *pending = false;
  timer.cancel();
  LOG(DEBUG) << "connection " << ident << " established to " << where << ENDL;
}

void connection::begin_exchange() {
  ++served;
  status = state::active;
  frame = {};
  remaining = 0;
  step = chunk_step::size_line;
  keep = false;
  complete = false;
}

auto connection::write(std::string_view first, std::string_view second, std::string_view third) -> awaitable<void> {
  const std::array<asio::const_buffer, 3> pieces{
    asio::buffer(first.data(), first.size()),
    asio::buffer(second.data(), second.size()),
    asio::buffer(third.data(), third.size())
  };
  boost::system::error_code ec;
  if (where.secure()) {
    co_await asio::async_write(stream, pieces, asio::redirect_error(use_awaitable, ec));
  } else {
    co_await asio::async_write(stream.next_layer(), pieces, asio::redirect_error(use_awaitable, ec));
  }
  if (ec || aborted) {
    fail(or_aborted(ec), false);
  }
}

auto connection::read_some(asio::mutable_buffer into) -> awaitable<std::size_t> {
  boost::system::error_code ec;
  std::size_t n{0};
  if (where.secure()) {
    n = co_await stream.async_read_some(into, asio::redirect_error(use_awaitable, ec));
  } else {
    n = co_await stream.next_layer().async_read_some(into, asio::redirect_error(use_awaitable, ec));
  }
  if (aborted) {
    fail_with(*aborted, "exchange aborted while reading");
  }
  if (ec == asio::error::eof || (where.secure() && ec == ssl::error::stream_truncated)) {
    peer_eof = true;
    co_return n;
  }
  if (ec) {
    fail(ec, false);
  }
  co_return n;
}

auto connection::fill(char* into, std::size_t size) -> awaitable<std::size_t> {
  if (!inbuf.empty()) {
    const auto n{std::min(size, inbuf.size())};
    std::copy_n(inbuf.data(), n, into);
    inbuf.erase(0, n);
    co_return n;
  }
  if (peer_eof) {
    co_return 0;
  }
  co_return co_await read_some(asio::buffer(into, size));
}

auto connection::read_line() -> awaitable<std::string> {
  std::array<char, 1024> scratch;
  while (true) {
    if (const auto end = inbuf.find(http::crlf); end != std::string::npos) {
      auto line{inbuf.substr(0, end)};
      inbuf.erase(0, end + http::crlf.size());
      co_return line;
    }
    if (inbuf.size() > http::max_line_size) {
      fail_with(client_errc::protocol_error, "chunk framing line too long");
    }
    if (peer_eof) {
      fail_with(client_errc::connection_closed_by_peer, "connection closed inside chunked body");
    }
    const auto n{co_await read_some(asio::buffer(scratch))};
    inbuf.append(scratch.data(), n);
  }
}

auto connection::read_head(std::string_view method) -> awaitable<response_head> {
  std::array<char, 4096> scratch;
  while (true) {
    if (const auto end = inbuf.find(http::end_of_head); end != std::string::npos) {
      response_head head;
      try {
        head = http::parse_head(std::string_view{inbuf}.substr(0, end + http::end_of_head.size()));
        inbuf.erase(0, end + http::end_of_head.size());
        if (head.code.code == 101) {
          throw client_error{client_errc::protocol_error, "protocol upgrade is not supported"};
        }
        if (head.code.informational()) {
          LOG(TRACE) << "connection " << ident << " skipping interim response " << head.code.code << ENDL;
          continue;
        }
        frame = http::framing_of(method, head);
      } catch (const client_error& e) {
        LOG(WARNING) << "connection " << ident << " to " << where << ": " << e.what() << ENDL;
        broken = true;
        close();
        throw;
      }
      keep = http::keep_alive(head) && frame.how != body_framing::kind::until_close;
      remaining = frame.length;
      complete = frame.how == body_framing::kind::none;
      co_return head;
    }
    if (inbuf.size() > http::max_head_size) {
      fail_with(client_errc::protocol_error, "response head too large");
    }
    if (peer_eof) {
      fail_with(client_errc::connection_closed_by_peer,
           inbuf.empty() ? "connection closed before the response" : "connection closed inside the response head");
    }
    const auto n{co_await read_some(asio::buffer(scratch))};
    inbuf.append(scratch.data(), n);
  }
}

auto connection::read_body() -> awaitable<std::optional<pooled_buffer>> {
  if (complete) {
    co_return std::nullopt;
  }
  switch (frame.how) {
    case body_framing::kind::none:
      complete = true;
      co_return std::nullopt;

    case body_framing::kind::length: {
      auto chunk{buffers->acquire()};
      const auto n{co_await fill(chunk.data(), std::min(remaining, chunk.capacity()))};
      if (n == 0) {
        fail_with(client_errc::connection_closed_by_peer,
             "connection closed with " + std::to_string(remaining) + " body bytes outstanding");
      }
      chunk.resize(n);
      remaining -= n;
      complete = remaining == 0;
      co_return std::optional<pooled_buffer>{std::move(chunk)};
    }

    case body_framing::kind::until_close: {
      auto chunk{buffers->acquire()};
      const auto n{co_await fill(chunk.data(), chunk.capacity())};
      if (n == 0) {
        complete = true;
        keep = false;
        co_return std::nullopt;
      }
      chunk.resize(n);
      co_return std::optional<pooled_buffer>{std::move(chunk)};
    }

    case body_framing::kind::chunked:
      co_return co_await read_chunked();
  }
  co_return std::nullopt;
}

auto connection::read_chunked() -> awaitable<std::optional<pooled_buffer>> {
  while (true) {
    switch (step) {
      case chunk_step::size_line: {
        const auto line{co_await read_line()};
        try {
          remaining = http::parse_chunk_size(line);
        } catch (const client_error&) {
          broken = true;
          close();
          throw;
        }
        step = remaining == 0 ? chunk_step::trailers : chunk_step::data;
        break;
      }

      case chunk_step::data: {
        auto chunk{buffers->acquire()};
        const auto n{co_await fill(chunk.data(), std::min(remaining, chunk.capacity()))};
        if (n == 0) {
          fail_with(client_errc::connection_closed_by_peer, "connection closed inside a body chunk");
        }
        chunk.resize(n);
        remaining -= n;
        if (remaining == 0) {
          step = chunk_step::data_end;
        }
        co_return std::optional<pooled_buffer>{std::move(chunk)};
      }

      case chunk_step::data_end: {
        const auto line{co_await read_line()};
        if (!line.empty()) {
          fail_with(client_errc::protocol_error, "missing CRLF after body chunk");
        }
        step = chunk_step::size_line;
        break;
      }

      case chunk_step::trailers: {
        // trailer fields are read and dropped
        const auto line{co_await read_line()};
        if (line.empty()) {
          step = chunk_step::done;
        }
        break;
      }

      case chunk_step::done:
        complete = true;
        co_return std::nullopt;
    }
  }
}

void connection::fail(const boost::system::error_code& ec, bool connecting) {
  const auto reason{aborted ? *aborted : classify(ec, connecting)};
  broken = true;
  const auto what{(connecting ? "connecting to " : "talking to ") + where.to_string() + ": " + ec.message()};
  close();
  throw client_error{reason, what};
}

void connection::fail_with(client_errc reason, const std::string& what) {
  broken = true;
  close();
  throw client_error{aborted ? *aborted : reason, where.to_string() + ": " + what};
}

void connection::abort(client_errc reason) {
  if (!aborted) {
    aborted = reason;
  }
  broken = true;
  close();
}

void connection::close() {
  if (status == state::closed) {
    return;
  }
  status = state::closing;
  boost::system::error_code ignored;
  resolver.cancel();
  auto& socket{stream.next_layer()};
  if (socket.is_open()) {
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
  }
  status = state::closed;
}

auto connection::is_open() const -> bool {
  return status != state::closed && status != state::closing && stream.next_layer().is_open();
}

void connection::set_state(state s) {
  status = s;
  if (s == state::idle) {
    idle_at = clock_type::now();
  }
}

auto connection::alive_when_idle() -> bool {
  if (!is_open() || broken || peer_eof || !inbuf.empty()) {
    return false;
  }
  auto& socket{stream.next_layer()};
  boost::system::error_code ec;
  const auto pending{socket.available(ec)};
  if (ec) {
    return false;
  }
  if (pending > 0) {
    // TLS peers may send session tickets after the handshake; plain HTTP
    // peers have nothing to say between exchanges.
    return where.secure();
  }
  char probe;
  socket.non_blocking(true, ec);
  if (ec) {
    return false;
  }
  socket.receive(asio::buffer(&probe, 1), tcp::socket::message_peek, ec);
  boost::system::error_code restore;
  socket.non_blocking(false, restore);
  return ec == asio::error::would_block;
}

auto connection::reusable() const -> bool {
  return keep && complete && !broken && !aborted && !peer_eof && inbuf.empty() && is_open();
}

}	// end of namespace courier
