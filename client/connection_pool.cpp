#include "client/connection_pool.hh"
#include "log/logging.hh"
#include <boost/asio/dispatch.hpp>
#include <algorithm>
#include <atomic>
#include <exception>

namespace courier {
namespace {

static std::atomic<std::uint64_t> connection_ids{0};

}		// end of local namespace

lease::lease(std::shared_ptr<connection_pool> p, std::shared_ptr<connection> c, bool reused) :
  pool{std::move(p)}, conn{std::move(c)}, was_idle{reused} {
}

lease::lease(lease&& other) noexcept :
  pool{std::move(other.pool)}, conn{std::move(other.conn)}, was_idle{other.was_idle} {
}

lease& lease::operator = (lease&& other) noexcept {
  if (this != &other) {
    reset();
    pool = std::move(other.pool);
    conn = std::move(other.conn);
    was_idle = other.was_idle;
  }
  return *this;
}

lease::~lease() {
  reset();
}

void lease::release() {
  if (pool) {
    auto p{pool};
    p->release(*this);
  }
}

void lease::evict() {
  if (pool) {
    auto p{pool};
    p->evict(*this);
  }
}

void lease::reset() {
  if (conn && pool) {
    // abandoned mid exchange: the framing state is unknown
    auto p{std::move(pool)};
    auto c{std::move(conn)};
    auto executor{c->executor()};
    asio::dispatch(executor, [p, c] {
      p->give_back(c, false);
    });
  }
  pool.reset();
  conn.reset();
}

connection_pool::connection_pool(only_create, asio::any_io_executor executor, ssl::context& t, client_config c,
                                 std::shared_ptr<buffer_pool> b) :
  ex{executor}, tls{t}, config{std::move(c)}, buffers{std::move(b)}, sweeper{executor} {
}

auto connection_pool::create(asio::any_io_executor executor, ssl::context& tls, client_config config,
                             std::shared_ptr<buffer_pool> buffers) -> std::shared_ptr<connection_pool> {
  return std::make_shared<connection_pool>(only_create{}, executor, tls, std::move(config), std::move(buffers));
}

void connection_pool::checked_out(slot& s, const std::shared_ptr<connection>& conn) {
  s.busy.push_back(conn);
  s.peak = std::max(s.peak, s.active());
}

void connection_pool::checked_in(slot& s, const std::shared_ptr<connection>& conn) {
  s.busy.erase(std::remove(s.busy.begin(), s.busy.end(), conn), s.busy.end());
}

auto connection_pool::acquire(pool_key key, std::shared_ptr<exchange_control> control,
                              std::chrono::milliseconds connect_timeout) -> awaitable<lease> {
  auto self{shared_from_this()};
  auto& s{slots[key]};
  // a woken waiter owns one reserved unit of capacity until it uses it
  bool holds_reservation{false};
  auto drop_reservation = [&] {
    if (holds_reservation) {
      holds_reservation = false;
      --s.reserved;
    }
  };

  while (true) {
    if (control->aborted() || stopped) {
      if (holds_reservation) {
        drop_reservation();
        wake_next(s);
      }
      control->throw_if_aborted();
      throw client_error{client_errc::cancelled, "connection pool is shut down"};
    }

    while (!s.idle.empty()) {
      auto conn{std::move(s.idle.back())};
      s.idle.pop_back();
      if (conn->alive_when_idle()) {
        drop_reservation();
        conn->set_state(connection::state::active);
        checked_out(s, conn);
        ++total.acquired;
        ++total.reused;
        LOG(DEBUG) << "reusing connection " << conn->id() << " to " << key
                   << " after " << conn->exchanges() << " exchanges" << ENDL;
        co_return lease{self, std::move(conn), true};
      }
      LOG(DEBUG) << "discarding dead idle connection " << conn->id() << " to " << key << ENDL;
      conn->close();
      ++total.discarded;
    }

    drop_reservation();
    if (s.active() < config.max_connections_per_key) {
      auto conn{std::make_shared<connection>(ex, tls, key, ++connection_ids, buffers)};
      checked_out(s, conn);
      ++total.created;
      LOG(DEBUG) << "opening connection " << conn->id() << " to " << key
                 << " (" << s.active() << "/" << config.max_connections_per_key << " active)" << ENDL;

      std::weak_ptr<connection> weak{conn};
      control->on_abort(ex, [weak](client_errc reason) {
        if (auto c = weak.lock(); c) {
          c->abort(reason);
        }
      });
      std::exception_ptr failure;
      try {
        co_await conn->connect(connect_timeout, config.verify_peer);
      } catch (const std::exception& e) {
        LOG(WARNING) << "failed to open connection to " << key << ": " << e.what() << ENDL;
        failure = std::current_exception();
      }
      control->clear_abort();
      if (!failure && control->aborted()) {
        conn->close();
        failure = std::make_exception_ptr(client_error{*control->reason()});
      }
      if (failure) {
        checked_in(s, conn);
        ++total.connect_failures;
        wake_next(s);
        std::rethrow_exception(failure);
      }
      ++total.acquired;
      co_return lease{self, std::move(conn), false};
    }

    auto w{std::make_shared<waiter>(ex)};
    if (config.queue_timeout.count() > 0) {
      w->wake.expires_after(config.queue_timeout);
    } else {
      w->wake.expires_at(asio::steady_timer::time_point::max());
    }
    s.waiters.push_back(w);
    LOG(DEBUG) << "waiting for a connection to " << key << " (" << s.waiters.size() << " queued)" << ENDL;
    control->on_abort(ex, [w](client_errc) {
      w->wake.cancel();
    });
    boost::system::error_code ec;
    co_await w->wake.async_wait(asio::redirect_error(use_awaitable, ec));
    control->clear_abort();
    w->done = true;
    s.waiters.erase(std::remove(s.waiters.begin(), s.waiters.end(), w), s.waiters.end());

    if (w->handed) {
      ++total.acquired;
      lease handed{self, std::move(w->handed), true};
      if (control->aborted()) {
        release(handed);
        control->throw_if_aborted();
      }
      co_return std::move(handed);
    }
    if (w->notified) {
      // capacity was freed and reserved for this acquire
      holds_reservation = true;
      continue;
    }
    control->throw_if_aborted();
    if (!ec && !stopped) {
      LOG(WARNING) << "timed out waiting for a connection to " << key << ENDL;
      throw client_error{client_errc::queue_timeout,
                         "no connection to " + key.to_string() + " became available"};
    }
    throw client_error{client_errc::cancelled, "connection pool is shut down"};
  }
}

void connection_pool::release(lease& used) {
  if (!used.conn) {
    return;
  }
  auto conn{std::move(used.conn)};
  used.pool.reset();
  give_back(conn, conn->reusable());
}

void connection_pool::evict(lease& used) {
  if (!used.conn) {
    return;
  }
  auto conn{std::move(used.conn)};
  used.pool.reset();
  give_back(conn, false);
}

void connection_pool::give_back(const std::shared_ptr<connection>& conn, bool reuse) {
  auto& s{slots[conn->key()]};
  checked_in(s, conn);

  if (reuse && !stopped && conn->reusable()) {
    ++total.released;
    while (!s.waiters.empty()) {
      auto w{s.waiters.front()};
      s.waiters.pop_front();
      if (w->done) {
        continue;
      }
      w->done = true;
      w->handed = conn;
      checked_out(s, conn);
      LOG(TRACE) << "handing connection " << conn->id() << " to a queued request" << ENDL;
      w->wake.cancel();
      return;
    }
    conn->set_state(connection::state::idle);
    s.idle.push_back(conn);
    if (s.idle.size() > config.max_idle_per_key) {
      auto oldest{s.idle.front()};
      s.idle.erase(s.idle.begin());
      LOG(DEBUG) << "too many idle connections to " << conn->key() << ", closing " << oldest->id() << ENDL;
      oldest->close();
    }
    return;
  }

  ++total.closed;
  LOG(DEBUG) << "closing connection " << conn->id() << " to " << conn->key()
             << " after " << conn->exchanges() << " exchanges" << ENDL;
  conn->close();
  wake_next(s);
}

void connection_pool::wake_next(slot& s) {
  while (!s.waiters.empty()) {
    auto w{s.waiters.front()};
    s.waiters.pop_front();
    if (w->done) {
      continue;
    }
    w->done = true;
    w->notified = true;
    ++s.reserved;
    w->wake.cancel();
    return;
  }
}

void connection_pool::start() {
  if (running || stopped) {
    return;
  }
  running = true;
  asio::co_spawn(ex, sweep(), asio::detached);
}

auto connection_pool::sweep() -> awaitable<void> {
  auto self{shared_from_this()};
  boost::system::error_code ec;
  while (!stopped) {
    sweeper.expires_after(config.sweep_interval);
    co_await sweeper.async_wait(asio::redirect_error(use_awaitable, ec));
    if (stopped) {
      break;
    }
    const auto now{clock_type::now()};
    for (auto& [key, s] : slots) {
      const auto before{s.idle.size()};
      s.idle.erase(std::remove_if(s.idle.begin(), s.idle.end(), [&](const auto& conn) {
        const bool stale{now - conn->idle_since() >= config.idle_timeout};
        if (stale || !conn->alive_when_idle()) {
          LOG(DEBUG) << "sweeping " << (stale ? "stale" : "dead") << " connection " << conn->id()
                     << " to " << key << ENDL;
          conn->close();
          return true;
        }
        return false;
      }), s.idle.end());
      total.expired += before - s.idle.size();
    }
  }
  LOG(TRACE) << "connection sweep stopped" << ENDL;
}

void connection_pool::shutdown() {
  if (stopped) {
    return;
  }
  stopped = true;
  sweeper.cancel();
  for (auto& [key, s] : slots) {
    for (auto& conn : s.idle) {
      conn->close();
    }
    s.idle.clear();
    while (!s.waiters.empty()) {
      wake_next(s);
    }
    const auto in_use{s.busy};
    for (auto& conn : in_use) {
      LOG(DEBUG) << "aborting the exchange on connection " << conn->id() << " to " << key << ENDL;
      conn->abort(client_errc::cancelled);
    }
  }
}

auto connection_pool::in_flight() const -> std::size_t {
  std::size_t count{0};
  for (const auto& [key, s] : slots) {
    count += s.active() + s.waiters.size();
  }
  return count;
}

auto connection_pool::stats(const pool_key& key) const -> key_stats {
  key_stats result;
  if (const auto at = slots.find(key); at != slots.end()) {
    result.active = at->second.active();
    result.idle = at->second.idle.size();
    result.peak_active = at->second.peak;
    result.queued = static_cast<std::size_t>(std::count_if(at->second.waiters.begin(), at->second.waiters.end(),
        [](const auto& w) { return !w->done; }));
  }
  return result;
}

}	// end of namespace courier
