#include "client/uri.hh"
#include "client/errors.hh"
#include <boost/algorithm/string.hpp>
#include <vector>

namespace courier {
namespace {

auto invalid(std::string_view text, const char* why) -> client_error {
  return client_error{client_errc::invalid_request, std::string{why} + ": '" + std::string{text} + "'"};
}

auto has_bad_chars(std::string_view s) -> bool {
  for (auto c : s) {
    if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f) {
      return true;
    }
  }
  return false;
}

auto parse_port(std::string_view text, std::string_view digits) -> std::uint16_t {
  if (digits.empty() || digits.size() > 5) {
    throw invalid(text, "invalid port");
  }
  unsigned long value{0};
  for (auto c : digits) {
    if (c < '0' || c > '9') {
      throw invalid(text, "invalid port");
    }
    value = value * 10 + static_cast<unsigned long>(c - '0');
  }
  if (value == 0 || value > 65535) {
    throw invalid(text, "port out of range");
  }
  return static_cast<std::uint16_t>(value);
}

// RFC 3986 section 5.2.4, on the path part only
auto remove_dot_segments(const std::string& path) -> std::string {
  std::vector<std::string> out;
  std::vector<std::string> parts;
  boost::algorithm::split(parts, path, boost::algorithm::is_any_of("/"));
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const auto& seg{parts[i]};
    const bool last{i + 1 == parts.size()};
    if (seg == ".") {
      if (last) {
        out.emplace_back();
      }
    } else if (seg == "..") {
      if (out.size() > 1) {
        out.pop_back();
      }
      if (last) {
        out.emplace_back();
      }
    } else {
      out.push_back(seg);
    }
  }
  auto joined{boost::algorithm::join(out, "/")};
  if (joined.empty() || joined.front() != '/') {
    joined.insert(joined.begin(), '/');
  }
  return joined;
}

}		// end of local namespace

auto default_port_for(std::string_view scheme) -> std::uint16_t {
  return scheme == "https" ? 443 : 80;
}

auto uri::parse(std::string_view text) -> uri {
  const auto colon{text.find("://")};
  if (colon == std::string_view::npos || colon == 0) {
    throw invalid(text, "not an absolute URI");
  }
  uri result;
  result.scheme = boost::algorithm::to_lower_copy(std::string{text.substr(0, colon)});
  if (result.scheme != "http" && result.scheme != "https") {
    throw invalid(text, "unsupported scheme, only http and https are allowed");
  }

  auto rest{text.substr(colon + 3)};
  if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
    rest = rest.substr(0, hash);
  }
  const auto path_at{rest.find_first_of("/?")};
  auto authority{rest.substr(0, path_at)};
  if (path_at != std::string_view::npos) {
    result.target = std::string{rest.substr(path_at)};
    if (result.target.front() == '?') {
      result.target.insert(result.target.begin(), '/');
    }
  }
  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    // credentials in the URI are not sent
    authority = authority.substr(at + 1);
  }

  std::string_view host{authority};
  std::string_view port;
  if (!authority.empty() && authority.front() == '[') {
    const auto close{authority.find(']')};
    if (close == std::string_view::npos) {
      throw invalid(text, "unterminated IPv6 literal");
    }
    host = authority.substr(0, close + 1);
    auto after{authority.substr(close + 1)};
    if (!after.empty()) {
      if (after.front() != ':') {
        throw invalid(text, "invalid authority");
      }
      port = after.substr(1);
    }
  } else if (const auto c = authority.rfind(':'); c != std::string_view::npos) {
    host = authority.substr(0, c);
    port = authority.substr(c + 1);
  }
  if (host.empty() || has_bad_chars(host) || has_bad_chars(result.target)) {
    throw invalid(text, "invalid host or path");
  }
  result.host = boost::algorithm::to_lower_copy(std::string{host});
  result.port = port.empty() ? default_port_for(result.scheme) : parse_port(text, port);
  return result;
}

auto uri::resolve(std::string_view reference) const -> uri {
  const auto ref{boost::algorithm::trim_copy(std::string{reference})};
  if (ref.find("://") != std::string::npos) {
    return parse(ref);
  }
  if (boost::algorithm::starts_with(ref, "//")) {
    return parse(scheme + ":" + ref);
  }
  if (has_bad_chars(ref)) {
    throw invalid(ref, "invalid reference");
  }
  uri result{*this};
  auto r{ref.substr(0, ref.find('#'))};
  if (r.empty()) {
    return result;
  }
  if (r.front() == '?') {
    result.target = target.substr(0, target.find('?')) + r;
    return result;
  }
  std::string path;
  std::string query;
  if (const auto q = r.find('?'); q != std::string::npos) {
    path = r.substr(0, q);
    query = r.substr(q);
  } else {
    path = r;
  }
  if (path.front() != '/') {
    const auto base{target.substr(0, target.find('?'))};
    path = base.substr(0, base.rfind('/') + 1) + path;
  }
  result.target = remove_dot_segments(path) + query;
  return result;
}

auto uri::secure() const -> bool {
  return scheme == "https";
}

auto uri::default_port() const -> bool {
  return port == default_port_for(scheme);
}

auto uri::authority() const -> std::string {
  if (default_port()) {
    return host;
  }
  return host + ":" + std::to_string(port);
}

auto uri::to_string() const -> std::string {
  return scheme + "://" + authority() + target;
}

auto operator == (const uri& left, const uri& right) -> bool {
  return left.scheme == right.scheme && left.host == right.host &&
      left.port == right.port && left.target == right.target;
}

}	// end of namespace courier
