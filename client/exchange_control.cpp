#include "client/exchange_control.hh"
#include "log/logging.hh"
#include <boost/asio/post.hpp>

namespace courier {

auto exchange_control::create() -> std::shared_ptr<exchange_control> {
  return std::make_shared<exchange_control>(only_create{});
}

void exchange_control::cancel() {
  abort(client_errc::cancelled);
}

void exchange_control::abort(client_errc reason) {
  std::optional<asio::any_io_executor> where;
  abort_action what;
  std::uint64_t current{0};
  {
    std::lock_guard<std::mutex> guard{lock};
    if (why) {
      return;
    }
    why = reason;
    where = target;
    what = action;
    current = generation;
  }
  if (!where || !what) {
    return;
  }
  std::weak_ptr<exchange_control> weak{shared_from_this()};
  asio::post(*where, [weak, what, current, reason] {
    auto self = weak.lock();
    if (!self) {
      return;
    }
    {
      std::lock_guard<std::mutex> guard{self->lock};
      if (self->generation != current) {
        return;
      }
    }
    what(reason);
  });
}

void exchange_control::arm_deadline(asio::any_io_executor executor, std::chrono::milliseconds after) {
  std::lock_guard<std::mutex> guard{lock};
  deadline = std::make_unique<asio::steady_timer>(executor);
  deadline->expires_after(after);
  std::weak_ptr<exchange_control> weak{shared_from_this()};
  deadline->async_wait([weak, after](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock(); self) {
      LOG(INFO) << "request deadline of " << after.count() << "ms expired" << ENDL;
      self->abort(client_errc::request_timeout);
    }
  });
}

void exchange_control::disarm_deadline() {
  std::lock_guard<std::mutex> guard{lock};
  if (deadline) {
    auto* timer{deadline.get()};
    asio::post(timer->get_executor(), [self = shared_from_this(), timer] {
      timer->cancel();
    });
  }
}

void exchange_control::on_abort(asio::any_io_executor executor, abort_action a) {
  std::optional<client_errc> already;
  {
    std::lock_guard<std::mutex> guard{lock};
    ++generation;
    target = executor;
    action = a;
    already = why;
  }
  if (already) {
    // aborted before the action existed, we are on `executor` already
    a(*already);
  }
}

void exchange_control::clear_abort() {
  std::lock_guard<std::mutex> guard{lock};
  ++generation;
  target.reset();
  action = nullptr;
}

auto exchange_control::aborted() const -> bool {
  std::lock_guard<std::mutex> guard{lock};
  return why.has_value();
}

auto exchange_control::reason() const -> std::optional<client_errc> {
  std::lock_guard<std::mutex> guard{lock};
  return why;
}

void exchange_control::throw_if_aborted() const {
  if (const auto r = reason(); r) {
    throw client_error{*r};
  }
}

}	// end of namespace courier
