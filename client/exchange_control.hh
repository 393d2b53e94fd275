#pragma once
#include "network_fwd.hh"
#include "client/errors.hh"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace courier {

// Cancellation and deadline of one request, shared between the caller and
// the worker running the exchange. The first abort reason wins.
//
// Aborting runs the currently registered abort action on the worker that
// registered it (closing the connection in use, or waking a queued pool
// acquire). An action registered and then cleared before the abort gets
// there is skipped, so a connection already handed back is never touched.
class exchange_control : public std::enable_shared_from_this<exchange_control> {
  struct only_create {
    explicit only_create() = default;
  };

public:
  using abort_action = std::function<void(client_errc)>;

  static auto create() -> std::shared_ptr<exchange_control>;
  explicit exchange_control(only_create) {
  }

  // Safe to call from any thread, any number of times
  void cancel();
  void abort(client_errc reason);

  // Start the deadline timer on `executor`, once per exchange. Expiry
  // aborts with request_timeout.
  void arm_deadline(asio::any_io_executor executor, std::chrono::milliseconds after);
  void disarm_deadline();

  void on_abort(asio::any_io_executor executor, abort_action action);
  void clear_abort();

  auto aborted() const -> bool;
  auto reason() const -> std::optional<client_errc>;
  // Throws client_error(reason) once aborted
  void throw_if_aborted() const;

private:
  mutable std::mutex lock;
  std::optional<client_errc> why;
  std::optional<asio::any_io_executor> target;
  abort_action action;
  std::uint64_t generation{0};
  std::unique_ptr<asio::steady_timer> deadline;
};

}	// end of namespace courier
