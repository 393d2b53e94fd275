#pragma once
#include "network_fwd.hh"
#include "client/headers.hh"
#include "client/uri.hh"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace courier {

// Produces the next chunk of a request body, or an empty optional once the
// body is complete. The executor pulls the next chunk only after the
// previous one was written to the socket.
using chunk_source = std::function<awaitable<std::optional<std::string>>()>;

class request_body {
public:
  enum class kind {
    none,
    bytes,
    stream
  };

  auto text(std::string content, std::string type = "text/plain;charset=UTF-8") -> request_body&;
  auto bytes(std::string content, std::string type = "application/octet-stream") -> request_body&;
  // Body of unknown length, sent with chunked transfer coding
  auto stream(chunk_source source, std::string type = "application/octet-stream") -> request_body&;
  // Override the content type, an empty string sends none
  auto type(std::string content_type) -> request_body&;
  void clear();

  auto what() const -> kind {
    return held;
  }
  auto data() const -> const std::string& {
    return content;
  }
  auto source() const -> const chunk_source& {
    return producer;
  }
  auto content_type() const -> const std::string& {
    return media;
  }

private:
  kind held{kind::none};
  std::string content;
  chunk_source producer;
  std::string media;
};

// Describes one request. The configure callback passed to the client
// mutates it; once the request is dispatched the executor works on its own
// copy.
class request_spec {
public:
  request_spec() = default;
  explicit request_spec(uri target);

  // Any HTTP token, stored upper case. Throws client_error(invalid_request)
  // when `name` is not a valid method token.
  auto method(std::string_view name) -> request_spec&;
  auto get() -> request_spec& {
    return method("GET");
  }
  auto post() -> request_spec& {
    return method("POST");
  }
  auto put() -> request_spec& {
    return method("PUT");
  }
  auto del() -> request_spec& {
    return method("DELETE");
  }
  auto head() -> request_spec& {
    return method("HEAD");
  }
  auto patch() -> request_spec& {
    return method("PATCH");
  }

  auto headers() -> header_map& {
    return fields;
  }
  auto body() -> request_body& {
    return payload;
  }

  // Maximum redirect hops to follow, 0 disables redirect following
  auto redirects(unsigned int hops) -> request_spec&;
  // Deadline for the whole exchange: connect, write and read
  auto timeout(std::chrono::milliseconds d) -> request_spec&;
  auto connect_timeout(std::chrono::milliseconds d) -> request_spec&;
  // Cap for the buffered body of this request only
  auto max_content_length(std::size_t bytes) -> request_spec&;

  // Throws client_error(invalid_request) when a header name is not a token
  // or a header value (the body content type included) contains CR, LF or NUL.
  void validate() const;

  auto target() const -> const uri& {
    return where;
  }
  void retarget(uri to) {
    where = std::move(to);
  }
  auto method() const -> const std::string& {
    return verb;
  }
  auto headers() const -> const header_map& {
    return fields;
  }
  auto body() const -> const request_body& {
    return payload;
  }
  auto redirects() const -> std::optional<unsigned int> {
    return hops;
  }
  auto timeout() const -> std::optional<std::chrono::milliseconds> {
    return deadline;
  }
  auto connect_timeout() const -> std::optional<std::chrono::milliseconds> {
    return connect_deadline;
  }
  auto max_content_length() const -> std::optional<std::size_t> {
    return content_cap;
  }

private:
  uri where;
  std::string verb{"GET"};
  header_map fields;
  request_body payload;
  std::optional<unsigned int> hops;
  std::optional<std::chrono::milliseconds> deadline;
  std::optional<std::chrono::milliseconds> connect_deadline;
  std::optional<std::size_t> content_cap;
};

}	// end of namespace courier
