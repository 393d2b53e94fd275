#pragma once
#include "network_fwd.hh"
#include "client/headers.hh"
#include "client/request_executor.hh"
#include <string>
#include <string_view>

namespace courier {

// A response whose body was read completely into memory
class received_response {
public:
  received_response() = default;
  received_response(status code, header_map headers, std::string body);

  auto get_status() const -> const status& {
    return code;
  }
  auto status_code() const -> unsigned int {
    return code.code;
  }
  auto headers() const -> const header_map& {
    return fields;
  }
  auto body() const -> const std::string& {
    return content;
  }
  auto text() const -> std::string_view {
    return content;
  }
  auto content_type() const -> const media_type& {
    return media;
  }

private:
  status code;
  header_map fields;
  std::string content;
  media_type media;
};

// Read the body of `ex` into a single buffer of at most `max_content_length`
// bytes. A larger body closes the connection and fails with
// content_too_large. Runs on the connection's executor.
auto aggregate_response(exchange ex, std::size_t max_content_length) -> awaitable<received_response>;

}	// end of namespace courier
