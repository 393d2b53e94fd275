#include "client/headers.hh"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <ostream>

namespace courier {
namespace {

auto same_name(std::string_view a, std::string_view b) -> bool {
  return boost::algorithm::iequals(a, b);
}

}		// end of local namespace

header_map::header_map(std::initializer_list<field> init) : fields(init) {
}

auto header_map::add(std::string name, std::string value) -> header_map& {
  fields.emplace_back(std::move(name), std::move(value));
  return *this;
}

auto header_map::set(std::string name, std::string value) -> header_map& {
  auto at = std::find_if(fields.begin(), fields.end(), [&name](const auto& f) {
      return same_name(f.first, name);
  });
  if (at == fields.end()) {
    return add(std::move(name), std::move(value));
  }
  at->first = std::move(name);
  at->second = std::move(value);
  const auto& kept{at->first};
  fields.erase(std::remove_if(std::next(at), fields.end(), [&kept](const auto& f) {
      return same_name(f.first, kept);
  }), fields.end());
  return *this;
}

auto header_map::remove(std::string_view name) -> std::size_t {
  const auto before{fields.size()};
  fields.erase(std::remove_if(fields.begin(), fields.end(), [name](const auto& f) {
      return same_name(f.first, name);
  }), fields.end());
  return before - fields.size();
}

auto header_map::get(std::string_view name) const -> std::optional<std::string> {
  for (const auto& [n, v] : fields) {
    if (same_name(n, name)) {
      return v;
    }
  }
  return std::nullopt;
}

auto header_map::get_all(std::string_view name) const -> std::vector<std::string> {
  std::vector<std::string> values;
  for (const auto& [n, v] : fields) {
    if (same_name(n, name)) {
      values.push_back(v);
    }
  }
  return values;
}

auto header_map::contains(std::string_view name) const -> bool {
  return get(name).has_value();
}

auto header_map::has_token(std::string_view name, std::string_view token) const -> bool {
  for (const auto& value : get_all(name)) {
    std::vector<std::string> tokens;
    boost::algorithm::split(tokens, value, boost::algorithm::is_any_of(","));
    for (auto& t : tokens) {
      if (boost::algorithm::iequals(boost::algorithm::trim_copy(t), token)) {
        return true;
      }
    }
  }
  return false;
}

auto operator << (std::ostream& os, const header_map& headers) -> std::ostream& {
  for (const auto& [name, value] : headers) {
    os << name << ": " << value << "\n";
  }
  return os;
}

auto media_type::parse(std::string_view value) -> media_type {
  media_type result;
  result.raw = boost::algorithm::trim_copy(std::string{value});
  std::vector<std::string> parts;
  boost::algorithm::split(parts, result.raw, boost::algorithm::is_any_of(";"));
  if (parts.empty()) {
    return result;
  }
  result.type_ = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(parts.front()));
  for (std::size_t i = 1; i < parts.size(); ++i) {
    const auto eq{parts[i].find('=')};
    if (eq == std::string::npos) {
      continue;
    }
    auto name{boost::algorithm::trim_copy(parts[i].substr(0, eq))};
    if (boost::algorithm::iequals(name, "charset")) {
      auto v{boost::algorithm::trim_copy(parts[i].substr(eq + 1))};
      boost::algorithm::trim_if(v, boost::algorithm::is_any_of("\""));
      result.charset_ = v;
    }
  }
  return result;
}

auto media_type::text() const -> bool {
  return boost::algorithm::starts_with(type_, "text/");
}

auto media_type::json() const -> bool {
  return type_ == "application/json" || boost::algorithm::ends_with(type_, "+json");
}

auto default_reason(unsigned int code) -> std::string_view {
  switch (code) {
    case 100: return "Continue";
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 206: return "Partial Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 303: return "See Other";
    case 304: return "Not Modified";
    case 307: return "Temporary Redirect";
    case 308: return "Permanent Redirect";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 413: return "Content Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
  }
  return "Unknown";
}

auto hop_by_hop(std::string_view name) -> bool {
  static constexpr std::string_view names[] = {
    "connection", "keep-alive", "proxy-authenticate", "proxy-authorization",
    "te", "trailer", "transfer-encoding", "upgrade", "proxy-connection"
  };
  return std::any_of(std::begin(names), std::end(names), [name](auto n) {
      return boost::algorithm::iequals(n, name);
  });
}

}	// end of namespace courier
