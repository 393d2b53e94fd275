#pragma once
#include "client/headers.hh"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace courier {

class request_spec;

// Status line and header block of a response
struct response_head {
  unsigned int version_major{1};
  unsigned int version_minor{1};
  status code;
  header_map headers;
};

// How the body following a response head is delimited
struct body_framing {
  enum class kind {
    none,
    length,
    chunked,
    until_close
  };

  kind how{kind::none};
  std::size_t length{0};
};

namespace http {

inline constexpr std::string_view crlf{"\r\n"};
inline constexpr std::string_view end_of_head{"\r\n\r\n"};
inline constexpr std::size_t max_head_size{64 * 1024};
inline constexpr std::size_t max_line_size{8 * 1024};

// Request line and header block. Defaults (Host, User-Agent, Accept,
// Connection and the body framing headers) are added unless the request
// already carries them; framing headers are always ours.
auto serialize_head(const request_spec& request, const std::string& user_agent) -> std::string;

// Parse "HTTP/1.1 200 OK\r\nName: value\r\n...\r\n\r\n".
// Throws client_error(protocol_error) on malformed input.
auto parse_head(std::string_view block) -> response_head;

// Throws client_error(protocol_error) on conflicting or invalid framing
auto framing_of(std::string_view method, const response_head& head) -> body_framing;

// True when the connection may carry another exchange after this response
auto keep_alive(const response_head& head) -> bool;

// Size from a chunk size line (extensions are ignored)
auto parse_chunk_size(std::string_view line) -> std::size_t;

// "<hex size>\r\n" prefix of a chunk of `size` bytes
auto chunk_prefix(std::size_t size) -> std::string;

inline constexpr std::string_view last_chunk{"0\r\n\r\n"};

}	// end of namespace http
}	// end of namespace courier
