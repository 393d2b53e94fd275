#include "client/http_client.hh"
#include "client/response_sink.hh"
#include "tests/test_server.hh"
#include "tests/test_support.hh"
#include <boost/asio/read.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <string_view>

using namespace courier;
using namespace std::chrono_literals;

namespace {

class StreamedResponseTest : public ::testing::Test {
protected:
  test::test_server server;
  http_client client;
};

auto drain(body_stream& body) -> std::size_t {
  std::size_t total{0};
  while (auto chunk = body.next().get()) {
    total += chunk->size();
  }
  return total;
}

// Forward `response` to a loopback socket and return what arrived on the
// other end.
auto forward(streamed_response& response, streamed_response::header_action adjust, std::size_t& sent) -> std::string {
  test::side_loop loop;
  auto& ctx{loop.context()};
  tcp::acceptor acceptor{ctx, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}};
  tcp::socket reader{ctx};
  reader.connect(acceptor.local_endpoint());
  auto peer{acceptor.accept()};
  tcp_response_sink sink{peer};

  auto done{asio::co_spawn(ctx, [&]() -> awaitable<void> {
    co_await response.forward_to(sink, adjust);
    peer.shutdown(tcp::socket::shutdown_send);
  }, asio::use_future)};

  std::string received;
  boost::system::error_code ec;
  asio::read(reader, asio::dynamic_buffer(received), ec);
  done.get();
  sent = sink.bytes_sent();
  return received;
}

// Payload of a chunked message body, chunk boundaries are not kept
auto dechunk(std::string_view body) -> std::string {
  std::string payload;
  while (true) {
    const auto eol{body.find("\r\n")};
    if (eol == std::string_view::npos) {
      ADD_FAILURE() << "unterminated chunk size line";
      return payload;
    }
    const auto size{std::stoul(std::string{body.substr(0, eol)}, nullptr, 16)};
    body.remove_prefix(eol + 2);
    if (size == 0) {
      return payload;
    }
    payload.append(body.substr(0, size));
    body.remove_prefix(std::min(body.size(), size + 2));
  }
}

}		// end of local namespace

TEST_F(StreamedResponseTest, LargeBodyStreamsPastTheLimit) {
  auto response{client.request_stream(server.url("/large")).get()};
  EXPECT_EQ(response.status_code(), 200u);
  EXPECT_EQ(response.content_length().value(), 5u * 1024 * 1024);
  EXPECT_EQ(drain(response.body()), 5u * 1024 * 1024);
  EXPECT_TRUE(response.body().finished());

  // the buffered path refuses the same resource
  auto buffered{client.get(server.url("/large"))};
  EXPECT_EQ(test::failure_of(buffered), client_errc::content_too_large);
}

TEST_F(StreamedResponseTest, FinishedStreamReturnsTheConnection) {
  auto response{client.request_stream(server.url("/chunked?count=10")).get()};
  EXPECT_FALSE(response.content_length().has_value());
  EXPECT_EQ(drain(response.body()), 10u * 1024);
  EXPECT_FALSE(response.body().next().get().has_value());
  EXPECT_EQ(client.get(server.url("/simpleGet")).get().body(), "httpClientGet");
  EXPECT_EQ(server.accepted(), 1u);
}

TEST_F(StreamedResponseTest, ChunksArriveInOrder) {
  auto response{client.request_stream(server.url("/chunked?count=3")).get()};
  std::string body;
  while (auto chunk = response.body().next().get()) {
    body += chunk->view();
  }
  ASSERT_EQ(body.size(), 3072u);
  EXPECT_EQ(body[0], 'a');
  EXPECT_EQ(body[1024], 'b');
  EXPECT_EQ(body[2048], 'c');
}

TEST_F(StreamedResponseTest, CancelClosesTheConnection) {
  auto response{client.request_stream(server.url("/chunked?count=10")).get()};
  auto& body{response.body()};
  ASSERT_TRUE(body.next().get().has_value());
  ASSERT_TRUE(body.next().get().has_value());
  body.cancel();
  EXPECT_EQ(test::failure_of([&] { body.next().get(); }), client_errc::cancelled);
  EXPECT_TRUE(body.finished());

  EXPECT_EQ(client.pool_counters().closed, 1u);
  EXPECT_EQ(client.get(server.url("/simpleGet")).get().body(), "httpClientGet");
  EXPECT_EQ(server.accepted(), 2u);
}

TEST_F(StreamedResponseTest, DroppingAnUnreadStreamClosesTheConnection) {
  {
    auto response{client.request_stream(server.url("/chunked?count=10")).get()};
    EXPECT_EQ(response.status_code(), 200u);
  }
  EXPECT_EQ(client.get(server.url("/simpleGet")).get().body(), "httpClientGet");
  EXPECT_EQ(server.accepted(), 2u);
  const auto totals{client.pool_counters()};
  EXPECT_EQ(totals.acquired, totals.released + totals.closed);
}

TEST_F(StreamedResponseTest, DeadlineCoversTheBody) {
  auto response{client.request_stream(server.url("/chunked?count=50"), [](request_spec& request) {
    request.timeout(200ms);
  }).get()};
  EXPECT_EQ(test::failure_of([&] { drain(response.body()); }), client_errc::request_timeout);
}

TEST_F(StreamedResponseTest, CancelPendingStream) {
  auto stalled{client.request_stream(server.url("/stall"))};
  std::this_thread::sleep_for(50ms);
  stalled.cancel();
  EXPECT_EQ(test::failure_of(stalled), client_errc::cancelled);
}

TEST_F(StreamedResponseTest, CoroutineConsumer) {
  test::side_loop loop;
  auto total{asio::co_spawn(loop.context(), [this]() -> awaitable<std::size_t> {
    auto response{co_await client.async_request_stream(server.url("/large?bytes=100000"))};
    std::size_t n{0};
    while (auto chunk = co_await response.body().async_next()) {
      n += chunk->size();
    }
    co_return n;
  }, asio::use_future)};
  EXPECT_EQ(total.get(), 100000u);
}

TEST_F(StreamedResponseTest, ForwardWithKnownLength) {
  auto response{client.request_stream(server.url("/large?bytes=200000")).get()};
  std::size_t sent{0};
  const auto out{forward(response, {}, sent)};
  EXPECT_EQ(out.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
  EXPECT_NE(out.find("Content-Length: 200000\r\n"), std::string::npos);
  EXPECT_NE(out.find("Content-Type: application/octet-stream\r\n"), std::string::npos);
  EXPECT_EQ(out.find("Transfer-Encoding"), std::string::npos);
  EXPECT_EQ(out.size() - out.find("\r\n\r\n") - 4, 200000u);
  EXPECT_EQ(sent, 200000u);
}

TEST_F(StreamedResponseTest, ForwardChunkedWithAdjustedHeaders) {
  auto response{client.request_stream(server.url("/chunked?count=3")).get()};
  std::size_t sent{0};
  const auto out{forward(response, [](header_map& headers) {
    headers.set("X-Forwarded-By", "courier");
    headers.remove("Content-Type");
  }, sent)};
  EXPECT_EQ(out.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
  EXPECT_NE(out.find("Transfer-Encoding: chunked\r\n"), std::string::npos);
  EXPECT_NE(out.find("X-Forwarded-By: courier\r\n"), std::string::npos);
  EXPECT_EQ(out.find("Content-Type"), std::string::npos);
  EXPECT_EQ(out.substr(out.size() - 5), "0\r\n\r\n");
  const auto body_at{out.find("\r\n\r\n")};
  ASSERT_NE(body_at, std::string::npos);
  EXPECT_EQ(dechunk(std::string_view{out}.substr(body_at + 4)),
            std::string(1024, 'a') + std::string(1024, 'b') + std::string(1024, 'c'));
  EXPECT_EQ(sent, 3072u);
  // the upstream connection went back to the pool
  EXPECT_EQ(client.get(server.url("/simpleGet")).get().body(), "httpClientGet");
  EXPECT_EQ(server.accepted(), 1u);
}
