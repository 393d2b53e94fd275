#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace courier {

// An absolute http or https URI, split into the parts the client needs.
// The fragment is dropped; the target is the origin-form request target
// (path plus query, "/" when the path is empty).
struct uri {
  std::string scheme;
  std::string host;
  std::uint16_t port{0};
  std::string target{"/"};

  // Throws client_error(invalid_request) for anything that is not an
  // absolute http/https URI with a host.
  static auto parse(std::string_view text) -> uri;

  // Resolve a (possibly relative) reference, as found in a Location header.
  auto resolve(std::string_view reference) const -> uri;

  auto secure() const -> bool;
  auto default_port() const -> bool;

  // host[:port], the port is omitted when it is the scheme default
  auto authority() const -> std::string;
  auto to_string() const -> std::string;
};

auto operator == (const uri& left, const uri& right) -> bool;

auto default_port_for(std::string_view scheme) -> std::uint16_t;

}	// end of namespace courier
