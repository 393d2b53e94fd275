#include "client/http_client.hh"
#include "log/logging.hh"
#include <boost/asio/post.hpp>
#include <exception>

namespace courier {
namespace {

template<typename T, typename F>
auto run_on(io_workers::worker& w, F f) -> T {
  if (w.running_here()) {
    return f();
  }
  auto task{std::make_shared<std::packaged_task<T()>>(std::move(f))};
  auto result{task->get_future()};
  asio::post(w.executor(), [task] {
    (*task)();
  });
  return result.get();
}

}		// end of local namespace

http_client::http_client(client_config config) :
    settings{std::move(config)}, tls{ssl::context::tls_client} {
  if (!settings.buffers) {
    settings.buffers = buffer_pool::create();
  }
  tls.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                  ssl::context::no_sslv3 | ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1);
  boost::system::error_code ec;
  tls.set_default_verify_paths(ec);
  if (ec) {
    LOG(WARNING) << "failed to load the default CA certificates: " << ec.message() << ENDL;
  }
  workers = std::make_unique<io_workers>(settings.workers, tls, settings, settings.buffers);
  executor = std::make_unique<request_executor>(*workers, settings);
  LOG(DEBUG) << "http client started with " << workers->size() << " workers, max "
             << settings.max_connections_per_key << " connections per host" << ENDL;
}

http_client::~http_client() {
  shutdown();
}

void http_client::shutdown() {
  if (workers) {
    workers->stop();
  }
}

auto http_client::prepare(std::string_view target, const char* method, const configurer& configure) -> dispatch {
  // throws client_error(invalid_request) before anything else happens
  request_spec spec{uri::parse(target)};
  if (method) {
    spec.method(method);
  }
  if (configure) {
    configure(spec);
  }
  spec.validate();
  auto control{exchange_control::create()};
  auto home{workers->worker_for(pool_key::of(spec.target())).executor()};
  return {std::move(spec), std::move(control), home};
}

auto http_client::arm(const request_spec& spec, const std::shared_ptr<exchange_control>& control) -> awaitable<void> {
  control->arm_deadline(co_await this_coro::executor, spec.timeout().value_or(settings.request_timeout));
}

auto http_client::fetch(request_spec spec, std::shared_ptr<exchange_control> control) -> awaitable<received_response> {
  const auto cap{spec.max_content_length().value_or(settings.max_content_length)};
  const auto target{spec.target().to_string()};
  co_await arm(spec, control);

  received_response response;
  std::exception_ptr failure;
  try {
    auto ex{co_await executor->execute(std::move(spec), control)};
    const auto where{ex.conn->executor()};
    response = co_await asio::co_spawn(where, aggregate_response(std::move(ex), cap), use_awaitable);
  } catch (const std::exception& e) {
    LOG(DEBUG) << "request to " << target << " failed: " << e.what() << ENDL;
    failure = std::current_exception();
  }
  control->disarm_deadline();
  control->clear_abort();
  if (failure) {
    std::rethrow_exception(failure);
  }
  co_return response;
}

auto http_client::fetch_stream(request_spec spec, std::shared_ptr<exchange_control> control) -> awaitable<streamed_response> {
  const auto target{spec.target().to_string()};
  co_await arm(spec, control);

  std::exception_ptr failure;
  try {
    // the deadline keeps running while the body is streamed
    co_return streamed_response{co_await executor->execute(std::move(spec), control)};
  } catch (const std::exception& e) {
    LOG(DEBUG) << "streamed request to " << target << " failed: " << e.what() << ENDL;
    failure = std::current_exception();
  }
  control->disarm_deadline();
  control->clear_abort();
  std::rethrow_exception(failure);
}

auto http_client::get(std::string_view target, configurer configure) -> pending<received_response> {
  auto d{prepare(target, "GET", configure)};
  auto result{asio::co_spawn(d.home, fetch(std::move(d.spec), d.control), asio::use_future)};
  return {std::move(result), d.control};
}

auto http_client::post(std::string_view target, configurer configure) -> pending<received_response> {
  auto d{prepare(target, "POST", configure)};
  auto result{asio::co_spawn(d.home, fetch(std::move(d.spec), d.control), asio::use_future)};
  return {std::move(result), d.control};
}

auto http_client::request(std::string_view target, configurer configure) -> pending<received_response> {
  auto d{prepare(target, nullptr, configure)};
  auto result{asio::co_spawn(d.home, fetch(std::move(d.spec), d.control), asio::use_future)};
  return {std::move(result), d.control};
}

auto http_client::request_stream(std::string_view target, configurer configure) -> pending<streamed_response> {
  auto d{prepare(target, nullptr, configure)};
  auto result{asio::co_spawn(d.home, fetch_stream(std::move(d.spec), d.control), asio::use_future)};
  return {std::move(result), d.control};
}

auto http_client::async_get(std::string_view target, configurer configure) -> awaitable<received_response> {
  auto d{prepare(target, "GET", configure)};
  return asio::co_spawn(d.home, fetch(std::move(d.spec), d.control), use_awaitable);
}

auto http_client::async_post(std::string_view target, configurer configure) -> awaitable<received_response> {
  auto d{prepare(target, "POST", configure)};
  return asio::co_spawn(d.home, fetch(std::move(d.spec), d.control), use_awaitable);
}

auto http_client::async_request(std::string_view target, configurer configure) -> awaitable<received_response> {
  auto d{prepare(target, nullptr, configure)};
  return asio::co_spawn(d.home, fetch(std::move(d.spec), d.control), use_awaitable);
}

auto http_client::async_request_stream(std::string_view target, configurer configure) -> awaitable<streamed_response> {
  auto d{prepare(target, nullptr, configure)};
  return asio::co_spawn(d.home, fetch_stream(std::move(d.spec), d.control), use_awaitable);
}

auto http_client::pool_stats(const pool_key& key) -> connection_pool::key_stats {
  auto& w{workers->worker_for(key)};
  return run_on<connection_pool::key_stats>(w, [&w, key] {
    return w.pool().stats(key);
  });
}

auto http_client::pool_counters() -> connection_pool::totals {
  connection_pool::totals sum;
  for (std::size_t i = 0; i < workers->size(); ++i) {
    auto& w{workers->at(i)};
    const auto part{run_on<connection_pool::totals>(w, [&w] {
      return w.pool().counters();
    })};
    sum.acquired += part.acquired;
    sum.released += part.released;
    sum.closed += part.closed;
    sum.created += part.created;
    sum.reused += part.reused;
    sum.discarded += part.discarded;
    sum.expired += part.expired;
    sum.connect_failures += part.connect_failures;
  }
  return sum;
}

}	// end of namespace courier
