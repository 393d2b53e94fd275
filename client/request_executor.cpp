#include "client/request_executor.hh"
#include "client/errors.hh"
#include "log/logging.hh"
#include <boost/algorithm/string.hpp>

namespace courier {
namespace {

static constexpr std::size_t redirect_drain_limit{64 * 1024};

auto rewrite_as_get(unsigned int code, const std::string& method) -> bool {
  if (code == 303) {
    return method != "HEAD";
  }
  return (code == 301 || code == 302) && method != "GET" && method != "HEAD";
}

}		// end of local namespace

request_executor::request_executor(io_workers& w, const client_config& c) : workers{w}, config{c} {
}

auto request_executor::execute(request_spec request, std::shared_ptr<exchange_control> control) -> awaitable<exchange> {
  const auto max_hops{request.redirects().value_or(config.max_redirects)};
  unsigned int hops{0};
  while (true) {
    auto& owner{workers.worker_for(pool_key::of(request.target()))};
    auto ex{co_await asio::co_spawn(owner.executor(), send(request, control), use_awaitable)};

    auto next{max_hops > 0 ? redirect_for(ex) : std::nullopt};
    if (!next) {
      co_return std::move(ex);
    }
    const auto where{ex.conn->executor()};
    if (++hops > max_hops) {
      LOG(WARNING) << "giving up on " << ex.request.target().to_string() << " after "
                   << max_hops << " redirects" << ENDL;
      co_await asio::co_spawn(where, discard_body(std::move(ex), 0), use_awaitable);
      throw client_error{client_errc::too_many_redirects,
                         "more than " + std::to_string(max_hops) + " redirects"};
    }
    LOG(DEBUG) << ex.head.code.code << " redirect from " << ex.request.target().to_string()
               << " to " << next->target().to_string() << ENDL;
    co_await asio::co_spawn(where, discard_body(std::move(ex), redirect_drain_limit), use_awaitable);
    request = std::move(*next);
  }
}

auto request_executor::send(request_spec request, std::shared_ptr<exchange_control> control) -> awaitable<exchange> {
  const auto key{pool_key::of(request.target())};
  const auto connect_timeout{request.connect_timeout().value_or(config.connect_timeout)};

  exchange ex;
  ex.control = control;
  ex.conn = co_await workers.worker_for(key).pool().acquire(key, control, connect_timeout);
  auto conn{ex.conn.get()};
  LOG(DEBUG) << request.method() << " " << request.target().to_string() << ": connection acquired ("
             << conn->id() << (ex.conn.reused() ? ", reused" : ", new") << ")" << ENDL;

  std::weak_ptr<connection> weak{conn};
  control->on_abort(conn->executor(), [weak](client_errc reason) {
    if (auto c = weak.lock(); c) {
      LOG(DEBUG) << "aborting exchange on connection " << c->id() << ": "
                 << make_error_code(reason).message() << ENDL;
      c->abort(reason);
    }
  });

  conn->begin_exchange();
  const auto head{http::serialize_head(request, config.user_agent)};
  if (request.body().what() == request_body::kind::bytes) {
    co_await conn->write(head, request.body().data());
    LOG(TRACE) << "connection " << conn->id() << ": headers and body sent" << ENDL;
  } else {
    co_await conn->write(head);
    LOG(TRACE) << "connection " << conn->id() << ": headers sent" << ENDL;
    co_await write_body(*conn, request);
  }

  LOG(TRACE) << "connection " << conn->id() << ": awaiting response headers" << ENDL;
  ex.head = co_await conn->read_head(request.method());
  LOG(DEBUG) << request.method() << " " << request.target().to_string() << ": "
             << ex.head.code.code << " " << ex.head.code.reason << ENDL;
  ex.request = std::move(request);
  co_return std::move(ex);
}

auto request_executor::write_body(connection& conn, const request_spec& request) -> awaitable<void> {
  if (request.body().what() != request_body::kind::stream) {
    co_return;
  }
  const auto& source{request.body().source()};
  std::size_t sent{0};
  while (auto chunk = co_await source()) {
    if (chunk->empty()) {
      continue;
    }
    // one chunk in flight at a time, the source is not asked again before
    // the socket accepted this one
    co_await conn.write(http::chunk_prefix(chunk->size()), *chunk, http::crlf);
    sent += chunk->size();
  }
  co_await conn.write(http::last_chunk);
  LOG(TRACE) << "connection " << conn.id() << ": streamed body of " << sent << " bytes sent" << ENDL;
}

auto request_executor::redirect_for(const exchange& ex) const -> std::optional<request_spec> {
  if (!ex.head.code.redirect()) {
    return std::nullopt;
  }
  const auto location{ex.head.headers.get("Location")};
  if (!location || location->empty()) {
    return std::nullopt;
  }
  if (ex.request.body().what() == request_body::kind::stream) {
    // a streamed body cannot be sent twice
    return std::nullopt;
  }

  request_spec next{ex.request};
  next.retarget(ex.request.target().resolve(*location));
  if (rewrite_as_get(ex.head.code.code, ex.request.method())) {
    next.method("GET");
    next.body().clear();
    next.headers().remove("Content-Type");
  }
  if (pool_key::of(next.target()) != pool_key::of(ex.request.target())) {
    next.headers().remove("Host");
    next.headers().remove("Authorization");
    next.headers().remove("Cookie");
  }
  return next;
}

auto discard_body(exchange ex, std::size_t limit) -> awaitable<void> {
  auto conn{ex.conn.get()};
  const auto& framing{conn->framing()};
  const bool bounded{framing.how == body_framing::kind::chunked ||
      (framing.how == body_framing::kind::length && framing.length <= limit) ||
      framing.how == body_framing::kind::none};

  std::size_t dropped{0};
  if (bounded && limit > 0) {
    while (dropped <= limit) {
      auto chunk{co_await conn->read_body()};
      if (!chunk) {
        break;
      }
      dropped += chunk->size();
    }
  }
  ex.control->clear_abort();
  if (conn->body_complete()) {
    ex.conn.release();
  } else {
    ex.conn.evict();
  }
}

}	// end of namespace courier
