#include "client/errors.hh"
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>

namespace courier {
namespace {

class category_impl : public boost::system::error_category {
public:
  auto name() const noexcept -> const char* override {
    return "courier.client";
  }

  auto message(int ev) const -> std::string override {
    switch (static_cast<client_errc>(ev)) {
      case client_errc::invalid_request:
        return "invalid request";
      case client_errc::connect_error:
        return "failed to connect";
      case client_errc::request_timeout:
        return "request timed out";
      case client_errc::content_too_large:
        return "response content exceeds the maximum content length";
      case client_errc::too_many_redirects:
        return "too many redirects";
      case client_errc::protocol_error:
        return "HTTP protocol error";
      case client_errc::cancelled:
        return "request cancelled";
      case client_errc::queue_timeout:
        return "timed out waiting for a pooled connection";
      case client_errc::connection_closed_by_peer:
        return "connection closed by peer";
    }
    return "unknown client error";
  }
};

}		// end of local namespace

auto client_category() noexcept -> const boost::system::error_category& {
  static const category_impl instance;
  return instance;
}

auto make_error_code(client_errc e) noexcept -> boost::system::error_code {
  return {static_cast<int>(e), client_category()};
}

client_error::client_error(client_errc e) : boost::system::system_error(make_error_code(e)) {
}

client_error::client_error(client_errc e, const std::string& what) :
  boost::system::system_error(make_error_code(e), what) {
}

auto client_error::code_value() const noexcept -> client_errc {
  return static_cast<client_errc>(code().value());
}

auto classify(const boost::system::error_code& ec, bool while_connecting) -> client_errc {
  if (ec.category() == client_category()) {
    return static_cast<client_errc>(ec.value());
  }
  if (ec == boost::asio::error::operation_aborted) {
    return client_errc::cancelled;
  }
  if (while_connecting) {
    return client_errc::connect_error;
  }
  if (ec == boost::asio::ssl::error::stream_truncated) {
    return client_errc::connection_closed_by_peer;
  }
  if (ec.category() == boost::asio::error::get_ssl_category()) {
    return client_errc::protocol_error;
  }
  // eof, reset, broken pipe and friends: the peer went away mid exchange
  return client_errc::connection_closed_by_peer;
}

}	// end of namespace courier
