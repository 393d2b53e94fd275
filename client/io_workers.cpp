#include "client/io_workers.hh"
#include "log/logging.hh"
#include <boost/asio/post.hpp>
#include <exception>
#include <future>

namespace courier {
namespace {

constexpr auto unwind_poll{std::chrono::milliseconds{5}};
constexpr auto unwind_limit{std::chrono::seconds{2}};

}		// end of local namespace

io_workers::worker::worker(std::size_t i, ssl::context& tls, const client_config& config,
                           std::shared_ptr<buffer_pool> buffers) :
    index{i}, work{asio::make_work_guard(ctx)} {
  connections = connection_pool::create(ctx.get_executor(), tls, config, std::move(buffers));
  asio::post(ctx, [pool = connections] {
    pool->start();
  });
  thread = std::thread([this] {
    run();
  });
}

io_workers::worker::~worker() {
  stop();
}

void io_workers::worker::run() {
  LOG(DEBUG) << "I/O worker " << index << " started" << ENDL;
  while (true) {
    try {
      ctx.run();
      break;
    } catch (const std::exception& e) {
      LOG(ERROR) << "I/O worker " << index << ": unhandled error: " << e.what() << ENDL;
    }
  }
  // handlers made ready by the final aborts still run
  ctx.restart();
  try {
    ctx.poll();
  } catch (const std::exception& e) {
    LOG(ERROR) << "I/O worker " << index << ": unhandled error while stopping: " << e.what() << ENDL;
  }
  LOG(DEBUG) << "I/O worker " << index << " stopped" << ENDL;
}

auto io_workers::worker::running_here() -> bool {
  return ctx.get_executor().running_in_this_thread();
}

void io_workers::worker::abort_all() {
  if (!thread.joinable()) {
    return;
  }
  if (running_here()) {
    connections->shutdown();
    return;
  }
  const auto until{clock_type::now() + unwind_limit};
  while (true) {
    std::promise<std::size_t> left;
    auto count{left.get_future()};
    asio::post(ctx, [&left, pool = connections] {
      pool->shutdown();
      left.set_value(pool->in_flight());
    });
    const auto n{count.get()};
    if (n == 0) {
      return;
    }
    if (clock_type::now() >= until) {
      LOG(WARNING) << "I/O worker " << index << ": " << n << " exchanges still running at shutdown" << ENDL;
      return;
    }
    std::this_thread::sleep_for(unwind_poll);
  }
}

void io_workers::worker::stop() {
  if (!thread.joinable()) {
    return;
  }
  asio::post(ctx, [this, pool = connections] {
    pool->shutdown();
    work.reset();
    ctx.stop();
  });
  if (thread.get_id() == std::this_thread::get_id()) {
    // stopping from inside the worker itself, cannot join
    thread.detach();
  } else {
    thread.join();
  }
}

io_workers::io_workers(std::size_t count, ssl::context& tls, const client_config& config,
                       std::shared_ptr<buffer_pool> buffers) {
  if (count == 0) {
    count = 1;
  }
  workers.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    workers.push_back(std::make_unique<worker>(i, tls, config, buffers));
  }
}

io_workers::~io_workers() {
  stop();
}

auto io_workers::worker_for(const pool_key& key) -> worker& {
  return *workers[pool_key_hash{}(key) % workers.size()];
}

void io_workers::stop() {
  // exchanges may span workers, so all of them are aborted before any stops
  for (auto& w : workers) {
    w->abort_all();
  }
  for (auto& w : workers) {
    w->stop();
  }
}

}	// end of namespace courier
