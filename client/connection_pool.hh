#pragma once
#include "network_fwd.hh"
#include "client/buffer_pool.hh"
#include "client/client_config.hh"
#include "client/connection.hh"
#include "client/exchange_control.hh"
#include <cstdint>
#include <deque>
#include <memory>
#include <unordered_map>
#include <vector>

namespace courier {

class connection_pool;

// Exclusive use of a pooled connection for one exchange. A lease that is
// destroyed without being released closes its connection.
class lease {
public:
  lease() = default;
  lease(lease&& other) noexcept;
  lease& operator = (lease&& other) noexcept;
  lease(const lease&) = delete;
  lease& operator = (const lease&) = delete;
  ~lease();

  auto operator -> () const -> connection* {
    return conn.get();
  }
  auto get() const -> const std::shared_ptr<connection>& {
    return conn;
  }
  explicit operator bool () const {
    return static_cast<bool>(conn);
  }
  // The connection already served another exchange
  auto reused() const -> bool {
    return was_idle;
  }

  // Both must run on the connection's executor
  void release();
  void evict();

private:
  friend class connection_pool;
  lease(std::shared_ptr<connection_pool> p, std::shared_ptr<connection> c, bool reused);
  void reset();

  std::shared_ptr<connection_pool> pool;
  std::shared_ptr<connection> conn;
  bool was_idle{false};
};

// Connections of one I/O worker, grouped by pool_key. Every member function
// must be called on the worker's executor; the pool holds no locks.
class connection_pool : public std::enable_shared_from_this<connection_pool> {
  struct only_create {
    explicit only_create() = default;
  };

public:
  struct key_stats {
    std::size_t active{0};
    std::size_t idle{0};
    std::size_t queued{0};
    std::size_t peak_active{0};
  };

  struct totals {
    std::size_t acquired{0};
    std::size_t released{0};
    std::size_t closed{0};
    std::size_t created{0};
    std::size_t reused{0};
    std::size_t discarded{0};     // dead idle connections found on acquire
    std::size_t expired{0};       // idle connections removed by the sweep
    std::size_t connect_failures{0};
  };

  static auto create(asio::any_io_executor executor, ssl::context& tls, client_config config,
                     std::shared_ptr<buffer_pool> buffers) -> std::shared_ptr<connection_pool>;
  connection_pool(only_create, asio::any_io_executor executor, ssl::context& tls, client_config config,
                  std::shared_ptr<buffer_pool> buffers);

  connection_pool(const connection_pool&) = delete;
  connection_pool& operator = (const connection_pool&) = delete;

  // Hand out an idle connection for `key` (most recently used first),
  // establish a new one while below the per-key limit, or wait in FIFO order
  // until a connection is released.
  auto acquire(pool_key key, std::shared_ptr<exchange_control> control,
               std::chrono::milliseconds connect_timeout) -> awaitable<lease>;

  // Back to the idle set when the connection is reusable, closed otherwise
  void release(lease& used);
  void evict(lease& used);

  void start();
  // Close idle connections, fail queued acquires and abort every exchange
  // still holding a connection with client_errc::cancelled.
  void shutdown();
  // Connections checked out or reserved plus queued acquires, over all keys
  auto in_flight() const -> std::size_t;

  auto stats(const pool_key& key) const -> key_stats;
  auto counters() const -> totals {
    return total;
  }
  auto executor() const -> asio::any_io_executor {
    return ex;
  }

private:
  friend class lease;

  struct waiter {
    explicit waiter(asio::any_io_executor executor) : wake{executor} {
    }
    asio::steady_timer wake;
    std::shared_ptr<connection> handed;
    bool notified{false};
    bool done{false};
  };

  // `reserved` is capacity promised to a woken waiter that has not run yet;
  // it counts toward the per-key limit.
  struct slot {
    std::vector<std::shared_ptr<connection>> idle;
    std::vector<std::shared_ptr<connection>> busy;
    std::size_t reserved{0};
    std::size_t peak{0};
    std::deque<std::shared_ptr<waiter>> waiters;

    auto active() const -> std::size_t {
      return busy.size() + reserved;
    }
  };

  void give_back(const std::shared_ptr<connection>& conn, bool reuse);
  void wake_next(slot& s);
  void checked_out(slot& s, const std::shared_ptr<connection>& conn);
  void checked_in(slot& s, const std::shared_ptr<connection>& conn);
  auto sweep() -> awaitable<void>;

  asio::any_io_executor ex;
  ssl::context& tls;
  const client_config config;
  std::shared_ptr<buffer_pool> buffers;
  std::unordered_map<pool_key, slot, pool_key_hash> slots;
  asio::steady_timer sweeper;
  totals total;
  bool running{false};
  bool stopped{false};
};

}	// end of namespace courier
