#pragma once
#include "network_fwd.hh"
#include "client/buffer_pool.hh"
#include "client/client_config.hh"
#include "client/connection_pool.hh"
#include "client/errors.hh"
#include "client/exchange_control.hh"
#include "client/io_workers.hh"
#include "client/request_executor.hh"
#include "client/request_spec.hh"
#include "client/response_aggregator.hh"
#include "client/streamed_response.hh"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string_view>

namespace courier {

// Handle to the result of a request running on the client's workers.
// Waiting on it is up to the caller; cancel() can be called from any
// thread and makes the request fail with client_error(cancelled) unless it
// already completed.
template<typename T>
class pending {
public:
  pending(std::future<T> f, std::shared_ptr<exchange_control> c) :
      result{std::move(f)}, control{std::move(c)} {
  }

  auto get() -> T {
    return result.get();
  }
  void wait() const {
    result.wait();
  }
  template<typename Rep, typename Period>
  auto wait_for(const std::chrono::duration<Rep, Period>& timeout) const -> std::future_status {
    return result.wait_for(timeout);
  }
  auto ready() const -> bool {
    return result.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
  }
  auto valid() const -> bool {
    return result.valid();
  }
  void cancel() {
    control->cancel();
  }

private:
  std::future<T> result;
  std::shared_ptr<exchange_control> control;
};

// Asynchronous HTTP/1.1 client.
//
// Requests are dispatched to a fixed set of I/O workers and pooled
// connections are reused per (scheme, host, port). The configure callback
// runs synchronously on the calling thread before anything is sent; an
// invalid URI or scheme throws client_error(invalid_request) right away.
// Every other failure is reported through the returned handle.
class http_client {
public:
  using configurer = std::function<void(request_spec&)>;

  explicit http_client(client_config config = {});
  ~http_client();

  http_client(const http_client&) = delete;
  http_client& operator = (const http_client&) = delete;

  auto get(std::string_view target, configurer configure = {}) -> pending<received_response>;
  auto post(std::string_view target, configurer configure = {}) -> pending<received_response>;
  // The method is whatever the configure callback sets, GET by default
  auto request(std::string_view target, configurer configure = {}) -> pending<received_response>;
  // The body is not capped by max_content_length and is read on demand
  auto request_stream(std::string_view target, configurer configure = {}) -> pending<streamed_response>;

  // For callers that are coroutines themselves
  auto async_get(std::string_view target, configurer configure = {}) -> awaitable<received_response>;
  auto async_post(std::string_view target, configurer configure = {}) -> awaitable<received_response>;
  auto async_request(std::string_view target, configurer configure = {}) -> awaitable<received_response>;
  auto async_request_stream(std::string_view target, configurer configure = {}) -> awaitable<streamed_response>;

  auto config() const -> const client_config& {
    return settings;
  }
  auto buffers() const -> const std::shared_ptr<buffer_pool>& {
    return settings.buffers;
  }

  // Snapshot of the pool state of `key`, taken on its worker
  auto pool_stats(const pool_key& key) -> connection_pool::key_stats;
  // Pool counters summed over all workers
  auto pool_counters() -> connection_pool::totals;

  // Stop all workers. Requests in flight fail, the client cannot be used
  // afterwards.
  void shutdown();

private:
  struct dispatch {
    request_spec spec;
    std::shared_ptr<exchange_control> control;
    asio::any_io_executor home;
  };

  auto prepare(std::string_view target, const char* method, const configurer& configure) -> dispatch;
  auto fetch(request_spec spec, std::shared_ptr<exchange_control> control) -> awaitable<received_response>;
  auto fetch_stream(request_spec spec, std::shared_ptr<exchange_control> control) -> awaitable<streamed_response>;
  auto arm(const request_spec& spec, const std::shared_ptr<exchange_control>& control) -> awaitable<void>;

  client_config settings;
  ssl::context tls;
  std::unique_ptr<io_workers> workers;
  std::unique_ptr<request_executor> executor;
};

}	// end of namespace courier
