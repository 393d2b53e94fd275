#include "client/exchange_control.hh"
#include <gtest/gtest.h>
#include <future>

using namespace courier;
using namespace std::chrono_literals;

TEST(ExchangeControlTest, FirstReasonWins) {
  auto control{exchange_control::create()};
  EXPECT_FALSE(control->aborted());
  EXPECT_NO_THROW(control->throw_if_aborted());
  control->abort(client_errc::request_timeout);
  control->cancel();
  EXPECT_TRUE(control->aborted());
  EXPECT_EQ(control->reason().value(), client_errc::request_timeout);
  try {
    control->throw_if_aborted();
    FAIL() << "expected client_error";
  } catch (const client_error& e) {
    EXPECT_EQ(e.code_value(), client_errc::request_timeout);
  }
}

TEST(ExchangeControlTest, AbortRunsActionOnItsExecutor) {
  asio::io_context ctx;
  auto control{exchange_control::create()};
  std::optional<client_errc> seen;
  control->on_abort(ctx.get_executor(), [&seen](client_errc reason) {
    seen = reason;
  });
  control->cancel();
  EXPECT_FALSE(seen.has_value());
  ctx.run();
  ASSERT_TRUE(seen.has_value());
  EXPECT_EQ(*seen, client_errc::cancelled);
}

TEST(ExchangeControlTest, ClearedActionIsSkipped) {
  asio::io_context ctx;
  auto control{exchange_control::create()};
  bool ran{false};
  control->on_abort(ctx.get_executor(), [&ran](client_errc) {
    ran = true;
  });
  control->cancel();
  control->clear_abort();
  ctx.run();
  EXPECT_FALSE(ran);
}

TEST(ExchangeControlTest, LateRegistrationRunsImmediately) {
  asio::io_context ctx;
  auto control{exchange_control::create()};
  control->cancel();
  bool ran{false};
  control->on_abort(ctx.get_executor(), [&ran](client_errc) {
    ran = true;
  });
  ctx.run();
  EXPECT_TRUE(ran);
}

TEST(ExchangeControlTest, DeadlineAbortsWithTimeout) {
  asio::io_context ctx;
  auto control{exchange_control::create()};
  control->arm_deadline(ctx.get_executor(), 20ms);
  ctx.run();
  EXPECT_EQ(control->reason().value(), client_errc::request_timeout);
}

TEST(ExchangeControlTest, DisarmedDeadlineNeverFires) {
  asio::io_context ctx;
  auto control{exchange_control::create()};
  control->arm_deadline(ctx.get_executor(), 20ms);
  control->disarm_deadline();
  ctx.run();
  EXPECT_FALSE(control->aborted());
}
