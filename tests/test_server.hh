#pragma once
#include "network_fwd.hh"
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

namespace courier {
namespace test {

// Plain HTTP/1.1 server on an ephemeral loopback port, running on its own
// thread. Endpoints:
//   /simpleGet             200 "httpClientGet"
//   /simplePost            the request body upper cased
//   /echo                  "<method>:<body>"
//   /headers               the request header block
//   /large?bytes=N         N bytes (5 MiB by default) with a Content-Length,
//                          only the head for HEAD requests
//   /chunked?count=N       N chunked body parts of 1 KiB, 20ms apart
//   /slow                  200 "slow" after 300ms
//   /redirect/N            302 to /redirect/N-1, /redirect/0 answers "done"
//   /see-other             303 to /echo
//   /temporary             307 to /echo
//   /close                 200 "bye" and closes the connection
//   /hang-up               200 "hung up" without Connection: close, then
//                          closes the connection
//   /until-close           body delimited by closing the connection
//   /drop                  closes the connection without answering
//   /stall                 never answers
//   /status/N              empty response with status N
//   /json                  a JSON document
class test_server {
public:
  test_server();
  ~test_server();

  test_server(const test_server&) = delete;
  test_server& operator = (const test_server&) = delete;

  auto port() const -> std::uint16_t {
    return listening_on;
  }
  auto url(std::string_view path) const -> std::string;
  // Number of TCP connections accepted so far
  auto accepted() const -> std::size_t {
    return connections;
  }
  void stop();

private:
  auto accept_loop() -> awaitable<void>;
  auto serve(tcp::socket socket) -> awaitable<void>;

  asio::io_context ctx{1};
  tcp::acceptor acceptor;
  std::uint16_t listening_on{0};
  std::atomic<std::size_t> connections{0};
  std::thread thread;
};

// A port on the loopback interface nobody listens on
auto closed_port() -> std::uint16_t;

}	// end of namespace test
}	// end of namespace courier
