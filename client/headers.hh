#pragma once
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace courier {

// Ordered multi-map of HTTP header fields. Names compare case-insensitively,
// insertion order is preserved when the fields are written out.
class header_map {
public:
  using field = std::pair<std::string, std::string>;
  using const_iterator = std::vector<field>::const_iterator;

  header_map() = default;
  header_map(std::initializer_list<field> fields);

  // Append a field, keeping any existing fields with the same name
  auto add(std::string name, std::string value) -> header_map&;
  // Replace all fields with this name by a single one
  auto set(std::string name, std::string value) -> header_map&;
  auto remove(std::string_view name) -> std::size_t;

  auto get(std::string_view name) const -> std::optional<std::string>;
  auto get_all(std::string_view name) const -> std::vector<std::string>;
  auto contains(std::string_view name) const -> bool;
  // True when a comma separated value of `name` contains `token`
  auto has_token(std::string_view name, std::string_view token) const -> bool;

  auto size() const -> std::size_t {
    return fields.size();
  }
  auto empty() const -> bool {
    return fields.empty();
  }
  auto begin() const -> const_iterator {
    return fields.begin();
  }
  auto end() const -> const_iterator {
    return fields.end();
  }

private:
  std::vector<field> fields;
};

auto operator << (std::ostream& os, const header_map& headers) -> std::ostream&;

// Value of a Content-Type header, e.g. "text/plain; charset=UTF-8"
class media_type {
public:
  media_type() = default;
  static auto parse(std::string_view value) -> media_type;

  // lower case "type/subtype", empty when no content type was sent
  auto type() const -> const std::string& {
    return type_;
  }
  auto charset() const -> const std::optional<std::string>& {
    return charset_;
  }
  auto empty() const -> bool {
    return type_.empty();
  }
  auto text() const -> bool;
  auto json() const -> bool;
  auto to_string() const -> const std::string& {
    return raw;
  }

private:
  std::string type_;
  std::optional<std::string> charset_;
  std::string raw;
};

struct status {
  unsigned int code{0};
  std::string reason;

  auto informational() const -> bool {
    return code >= 100 && code < 200;
  }
  auto success() const -> bool {
    return code >= 200 && code < 300;
  }
  auto redirect() const -> bool {
    return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
  }
  auto failed() const -> bool {
    return code >= 400;
  }
};

auto default_reason(unsigned int code) -> std::string_view;

// Headers that describe a single connection and must not be forwarded
auto hop_by_hop(std::string_view name) -> bool;

}	// end of namespace courier
