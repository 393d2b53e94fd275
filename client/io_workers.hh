#pragma once
#include "network_fwd.hh"
#include "client/client_config.hh"
#include "client/connection_pool.hh"
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace courier {

// A fixed set of single threaded event loops. Every pool key belongs to
// exactly one worker, which owns the key's connections and pool state.
class io_workers {
public:
  class worker {
  public:
    worker(std::size_t index, ssl::context& tls, const client_config& config,
           std::shared_ptr<buffer_pool> buffers);
    ~worker();

    auto executor() -> asio::any_io_executor {
      return ctx.get_executor();
    }
    auto pool() -> connection_pool& {
      return *connections;
    }
    auto running_here() -> bool;
    // Shut the pool down so every exchange on this worker fails, then wait
    // a bounded time for them to unwind.
    void abort_all();
    void stop();

  private:
    void run();

    std::size_t index;
    asio::io_context ctx{1};
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work;
    std::shared_ptr<connection_pool> connections;
    std::thread thread;
  };

  io_workers(std::size_t count, ssl::context& tls, const client_config& config,
             std::shared_ptr<buffer_pool> buffers);
  ~io_workers();

  io_workers(const io_workers&) = delete;
  io_workers& operator = (const io_workers&) = delete;

  auto worker_for(const pool_key& key) -> worker&;
  auto at(std::size_t index) -> worker& {
    return *workers.at(index);
  }
  auto size() const -> std::size_t {
    return workers.size();
  }
  void stop();

private:
  std::vector<std::unique_ptr<worker>> workers;
};

}	// end of namespace courier
