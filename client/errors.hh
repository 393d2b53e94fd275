#pragma once
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <string>
#include <type_traits>

namespace courier {

// Failures reported by the client. Every asynchronous operation fails with
// one of these, wrapped in a client_error.
enum class client_errc {
  invalid_request = 1,        // bad scheme or URI, nothing was sent
  connect_error,              // DNS, TCP or TLS failure
  request_timeout,
  content_too_large,          // buffered body exceeded the configured cap
  too_many_redirects,
  protocol_error,             // malformed status line, headers or chunk framing
  cancelled,
  queue_timeout,              // pool saturated and the wait expired
  connection_closed_by_peer
};

auto client_category() noexcept -> const boost::system::error_category&;

auto make_error_code(client_errc e) noexcept -> boost::system::error_code;

class client_error : public boost::system::system_error {
public:
  explicit client_error(client_errc e);
  client_error(client_errc e, const std::string& what);

  auto code_value() const noexcept -> client_errc;
};

// Map an error reported by asio (or OpenSSL through asio) onto the
// client taxonomy. `while_connecting` selects connect_error for
// failures that happen before the connection is established.
auto classify(const boost::system::error_code& ec, bool while_connecting) -> client_errc;

}	// end of namespace courier

namespace boost {
namespace system {
template<>
struct is_error_code_enum<courier::client_errc> : std::true_type {};
}	// end of namespace system
}	// end of namespace boost
