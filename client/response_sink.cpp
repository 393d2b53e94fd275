#include "client/response_sink.hh"
#include "client/http_codec.hh"
#include "log/logging.hh"
#include <boost/algorithm/string.hpp>
#include <array>
#include <sstream>
#include <stdexcept>

namespace courier {

tcp_response_sink::tcp_response_sink(tcp::socket& p) : peer{p} {
}

auto tcp_response_sink::send_head(const status& code, const header_map& headers,
                                  std::optional<std::size_t> content_length) -> awaitable<void> {
  std::ostringstream out;
  out << "HTTP/1.1 " << code.code << " "
      << (code.reason.empty() ? std::string{default_reason(code.code)} : code.reason) << http::crlf;
  for (const auto& [name, value] : headers) {
    if (boost::algorithm::iequals(name, "Content-Length") || hop_by_hop(name)) {
      continue;
    }
    out << name << ": " << value << http::crlf;
  }
  chunked = !content_length.has_value();
  if (chunked) {
    out << "Transfer-Encoding: chunked" << http::crlf;
  } else {
    out << "Content-Length: " << *content_length << http::crlf;
  }
  out << http::crlf;
  const auto head{out.str()};
  co_await asio::async_write(peer, asio::buffer(head), use_awaitable);
  head_sent = true;
}

auto tcp_response_sink::send_chunk(std::string_view data) -> awaitable<void> {
  if (!head_sent) {
    throw std::logic_error{"response head must be sent before the body"};
  }
  if (data.empty()) {
    co_return;
  }
  if (chunked) {
    const auto prefix{http::chunk_prefix(data.size())};
    const std::array<asio::const_buffer, 3> pieces{
      asio::buffer(prefix), asio::buffer(data.data(), data.size()),
      asio::buffer(http::crlf.data(), http::crlf.size())
    };
    co_await asio::async_write(peer, pieces, use_awaitable);
  } else {
    co_await asio::async_write(peer, asio::buffer(data.data(), data.size()), use_awaitable);
  }
  sent += data.size();
}

auto tcp_response_sink::finish() -> awaitable<void> {
  if (chunked) {
    co_await asio::async_write(peer, asio::buffer(http::last_chunk.data(), http::last_chunk.size()),
                               use_awaitable);
  }
  LOG(DEBUG) << "forwarded " << sent << " body bytes" << ENDL;
}

}	// end of namespace courier
