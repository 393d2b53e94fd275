#include "client/http_client.hh"
#include "tests/test_server.hh"
#include "tests/test_support.hh"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace courier;
using namespace std::chrono_literals;

namespace {

auto key_of(const test::test_server& server) -> pool_key {
  return pool_key::of(uri::parse(server.url("/")));
}

}		// end of local namespace

TEST(PoolKeyTest, IdentifiesSchemeHostAndPort) {
  const auto a{pool_key::of(uri::parse("http://Example.com/a"))};
  const auto b{pool_key::of(uri::parse("http://example.com:80/b?c"))};
  const auto secure{pool_key::of(uri::parse("https://example.com/"))};
  EXPECT_EQ(a, b);
  EXPECT_NE(a, secure);
  EXPECT_EQ(pool_key_hash{}(a), pool_key_hash{}(b));
  EXPECT_TRUE(secure.secure());
  EXPECT_EQ(secure.port, 443);
}

TEST(ConnectionPoolTest, LimitsActiveConnectionsPerKey) {
  test::test_server server;
  client_config config;
  config.max_connections_per_key = 2;
  http_client client{config};

  std::vector<pending<received_response>> all;
  for (int i = 0; i < 5; ++i) {
    all.push_back(client.get(server.url("/slow")));
  }
  std::this_thread::sleep_for(150ms);
  const auto busy{client.pool_stats(key_of(server))};
  EXPECT_EQ(busy.active, 2u);
  EXPECT_EQ(busy.queued, 3u);

  for (auto& p : all) {
    EXPECT_EQ(p.get().body(), "slow");
  }
  const auto after{client.pool_stats(key_of(server))};
  EXPECT_EQ(after.active, 0u);
  EXPECT_EQ(after.queued, 0u);
  EXPECT_EQ(after.peak_active, 2u);
  EXPECT_EQ(after.idle, 2u);
  EXPECT_EQ(server.accepted(), 2u);
}

TEST(ConnectionPoolTest, QueuedRequestTimesOut) {
  test::test_server server;
  client_config config;
  config.max_connections_per_key = 1;
  config.queue_timeout = 100ms;
  http_client client{config};

  auto slow{client.get(server.url("/slow"))};
  auto queued{client.get(server.url("/simpleGet"))};
  EXPECT_EQ(test::failure_of(queued), client_errc::queue_timeout);
  EXPECT_EQ(slow.get().body(), "slow");
  EXPECT_EQ(client.pool_stats(key_of(server)).queued, 0u);
}

TEST(ConnectionPoolTest, CancelWhileQueued) {
  test::test_server server;
  client_config config;
  config.max_connections_per_key = 1;
  http_client client{config};

  auto slow{client.get(server.url("/slow"))};
  auto queued{client.get(server.url("/simpleGet"))};
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(client.pool_stats(key_of(server)).queued, 1u);
  queued.cancel();
  EXPECT_EQ(test::failure_of(queued), client_errc::cancelled);
  EXPECT_EQ(slow.get().body(), "slow");
  // the cancelled waiter did not take the connection with it
  EXPECT_EQ(client.get(server.url("/simpleGet")).get().body(), "httpClientGet");
  EXPECT_EQ(server.accepted(), 1u);
}

TEST(ConnectionPoolTest, ClosedConnectionWakesAWaiter) {
  test::test_server server;
  client_config config;
  config.max_connections_per_key = 1;
  http_client client{config};

  auto closing{client.get(server.url("/close"))};
  auto queued{client.get(server.url("/simpleGet"))};
  EXPECT_EQ(closing.get().body(), "bye");
  EXPECT_EQ(queued.get().body(), "httpClientGet");
  EXPECT_EQ(server.accepted(), 2u);
}

TEST(ConnectionPoolTest, AcquisitionsBalanceReleasesAndCloses) {
  test::test_server server;
  client_config config;
  config.max_connections_per_key = 3;
  http_client client{config};

  std::vector<pending<received_response>> ok;
  for (int i = 0; i < 6; ++i) {
    ok.push_back(client.get(server.url("/simpleGet")));
  }
  auto too_large{client.get(server.url("/large"))};
  auto dropped{client.get(server.url("/drop"))};
  auto closing{client.get(server.url("/close"))};
  for (auto& p : ok) {
    p.get();
  }
  EXPECT_EQ(test::failure_of(too_large), client_errc::content_too_large);
  EXPECT_EQ(test::failure_of(dropped), client_errc::connection_closed_by_peer);
  closing.get();

  const auto totals{client.pool_counters()};
  EXPECT_EQ(totals.acquired, 9u);
  EXPECT_EQ(totals.acquired, totals.released + totals.closed);
  EXPECT_GE(totals.closed, 3u);
}

TEST(ConnectionPoolTest, PeerClosedIdleConnectionIsReplaced) {
  test::test_server server;
  http_client client;

  EXPECT_EQ(client.get(server.url("/hang-up")).get().body(), "hung up");
  EXPECT_EQ(client.pool_stats(key_of(server)).idle, 1u);
  std::this_thread::sleep_for(100ms);

  EXPECT_EQ(client.get(server.url("/simpleGet")).get().body(), "httpClientGet");
  const auto totals{client.pool_counters()};
  EXPECT_EQ(totals.discarded, 1u);
  EXPECT_EQ(totals.reused, 0u);
  EXPECT_EQ(totals.created, 2u);
  EXPECT_EQ(server.accepted(), 2u);
}

TEST(ConnectionPoolTest, WokenWaiterKeepsItsTurn) {
  test::test_server server;
  test::side_loop loop;
  ssl::context tls{ssl::context::tls_client};
  client_config config;
  config.max_connections_per_key = 1;
  auto pool{connection_pool::create(loop.context().get_executor(), tls, config, buffer_pool::create())};
  const auto key{key_of(server)};
  std::vector<std::string> order;

  auto take_turn = [&](std::string name) -> awaitable<void> {
    auto turn{co_await pool->acquire(key, exchange_control::create(), 1s)};
    order.push_back(name);
    turn.evict();
  };

  asio::co_spawn(loop.context(), [&]() -> awaitable<void> {
    auto first{co_await pool->acquire(key, exchange_control::create(), 1s)};
    asio::co_spawn(loop.context(), take_turn("queued"), asio::detached);
    asio::steady_timer settle{loop.context(), 50ms};
    co_await settle.async_wait(use_awaitable);
    EXPECT_EQ(pool->stats(key).queued, 1u);

    // the freed capacity belongs to the queued acquire, not to a newcomer
    first.evict();
    EXPECT_EQ(pool->stats(key).active, 1u);
    co_await take_turn("newcomer");
    pool->shutdown();
  }, asio::use_future).get();

  ASSERT_EQ(order.size(), 2u);
  EXPECT_EQ(order[0], "queued");
  EXPECT_EQ(order[1], "newcomer");
}

TEST(ConnectionPoolTest, IdleConnectionsExpire) {
  test::test_server server;
  client_config config;
  config.idle_timeout = 100ms;
  config.sweep_interval = 50ms;
  http_client client{config};

  EXPECT_EQ(client.get(server.url("/simpleGet")).get().body(), "httpClientGet");
  EXPECT_EQ(client.pool_stats(key_of(server)).idle, 1u);
  std::this_thread::sleep_for(400ms);
  EXPECT_EQ(client.pool_stats(key_of(server)).idle, 0u);
  EXPECT_EQ(client.pool_counters().expired, 1u);

  EXPECT_EQ(client.get(server.url("/simpleGet")).get().body(), "httpClientGet");
  EXPECT_EQ(server.accepted(), 2u);
}

TEST(ConnectionPoolTest, IdleSetIsBounded) {
  test::test_server server;
  client_config config;
  config.max_connections_per_key = 4;
  config.max_idle_per_key = 1;
  http_client client{config};

  std::vector<pending<received_response>> all;
  for (int i = 0; i < 4; ++i) {
    all.push_back(client.get(server.url("/slow")));
  }
  for (auto& p : all) {
    p.get();
  }
  const auto stats{client.pool_stats(key_of(server))};
  EXPECT_EQ(stats.idle, 1u);
  EXPECT_EQ(stats.peak_active, 4u);
}

TEST(ConnectionPoolTest, ShutdownIsIdempotent) {
  test::test_server server;
  http_client client;
  EXPECT_EQ(client.get(server.url("/simpleGet")).get().body(), "httpClientGet");
  client.shutdown();
  client.shutdown();
}
