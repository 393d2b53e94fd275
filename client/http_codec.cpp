#include "client/http_codec.hh"
#include "client/errors.hh"
#include "client/request_spec.hh"
#include <boost/algorithm/string.hpp>
#include <cctype>
#include <sstream>
#include <vector>

namespace courier {
namespace http {
namespace {

auto malformed(const std::string& what) -> client_error {
  return client_error{client_errc::protocol_error, what};
}

auto parse_unsigned(std::string_view digits, int base) -> std::optional<std::size_t> {
  if (digits.empty() || digits.size() > 15) {
    return std::nullopt;
  }
  std::size_t value{0};
  for (auto c : digits) {
    int d{-1};
    if (c >= '0' && c <= '9') {
      d = c - '0';
    } else if (base == 16 && c >= 'a' && c <= 'f') {
      d = c - 'a' + 10;
    } else if (base == 16 && c >= 'A' && c <= 'F') {
      d = c - 'A' + 10;
    }
    if (d < 0) {
      return std::nullopt;
    }
    value = value * static_cast<std::size_t>(base) + static_cast<std::size_t>(d);
  }
  return value;
}

auto without_body(std::string_view method, unsigned int code) -> bool {
  return method == "HEAD" || (code >= 100 && code < 200) || code == 204 || code == 304;
}

}		// end of local namespace

auto serialize_head(const request_spec& request, const std::string& user_agent) -> std::string {
  const auto& target{request.target()};
  const auto& body{request.body()};
  const auto& user{request.headers()};

  std::ostringstream out;
  out << request.method() << " " << target.target << " HTTP/1.1\r\n";
  if (!user.contains("Host")) {
    out << "Host: " << target.authority() << crlf;
  }
  if (!user.contains("User-Agent") && !user_agent.empty()) {
    out << "User-Agent: " << user_agent << crlf;
  }
  if (!user.contains("Accept")) {
    out << "Accept: */*" << crlf;
  }
  if (!user.contains("Connection")) {
    out << "Connection: keep-alive" << crlf;
  }
  if (body.what() != request_body::kind::none && !body.content_type().empty() &&
      !user.contains("Content-Type")) {
    out << "Content-Type: " << body.content_type() << crlf;
  }
  for (const auto& [name, value] : user) {
    if (boost::algorithm::iequals(name, "Content-Length") ||
        boost::algorithm::iequals(name, "Transfer-Encoding")) {
      continue;
    }
    out << name << ": " << value << crlf;
  }
  switch (body.what()) {
    case request_body::kind::bytes:
      out << "Content-Length: " << body.data().size() << crlf;
      break;
    case request_body::kind::stream:
      out << "Transfer-Encoding: chunked" << crlf;
      break;
    case request_body::kind::none:
      if (request.method() == "POST" || request.method() == "PUT" || request.method() == "PATCH") {
        out << "Content-Length: 0" << crlf;
      }
      break;
  }
  out << crlf;
  return out.str();
}

auto parse_head(std::string_view block) -> response_head {
  std::vector<std::string> lines;
  boost::algorithm::split(lines, block, boost::algorithm::is_any_of("\n"));
  for (auto& line : lines) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
  }
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  if (lines.empty()) {
    throw malformed("empty response head");
  }

  response_head head;
  const auto& status_line{lines.front()};
  // HTTP/x.y SP 3DIGIT [SP reason]
  if (status_line.size() < 12 || !boost::algorithm::starts_with(status_line, "HTTP/") ||
      status_line[6] != '.' || status_line[8] != ' ' ||
      !std::isdigit(static_cast<unsigned char>(status_line[5])) ||
      !std::isdigit(static_cast<unsigned char>(status_line[7]))) {
    throw malformed("invalid status line '" + status_line + "'");
  }
  head.version_major = static_cast<unsigned int>(status_line[5] - '0');
  head.version_minor = static_cast<unsigned int>(status_line[7] - '0');
  if (head.version_major != 1) {
    throw malformed("unsupported HTTP version in '" + status_line + "'");
  }
  const auto code{parse_unsigned(std::string_view{status_line}.substr(9, 3), 10)};
  if (!code || *code < 100 || *code > 999 || (status_line.size() > 12 && status_line[12] != ' ')) {
    throw malformed("invalid status code in '" + status_line + "'");
  }
  head.code.code = static_cast<unsigned int>(*code);
  head.code.reason = status_line.size() > 13 ? status_line.substr(13) : std::string{};

  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto& line{lines[i]};
    if (line.empty()) {
      throw malformed("empty line inside the header block");
    }
    if (line.front() == ' ' || line.front() == '\t') {
      throw malformed("obsolete header line folding");
    }
    const auto colon{line.find(':')};
    if (colon == std::string::npos || colon == 0) {
      throw malformed("invalid header line '" + line + "'");
    }
    auto name{line.substr(0, colon)};
    if (name.find_first_of(" \t") != std::string::npos) {
      throw malformed("whitespace in header name '" + name + "'");
    }
    head.headers.add(std::move(name), boost::algorithm::trim_copy(line.substr(colon + 1)));
  }
  return head;
}

auto framing_of(std::string_view method, const response_head& head) -> body_framing {
  if (without_body(method, head.code.code)) {
    return {body_framing::kind::none, 0};
  }
  if (head.headers.contains("Transfer-Encoding")) {
    const auto codings{head.headers.get_all("Transfer-Encoding")};
    auto last{boost::algorithm::trim_copy(codings.back())};
    if (const auto comma = last.rfind(','); comma != std::string::npos) {
      last = boost::algorithm::trim_copy(last.substr(comma + 1));
    }
    if (boost::algorithm::iequals(last, "chunked")) {
      return {body_framing::kind::chunked, 0};
    }
    return {body_framing::kind::until_close, 0};
  }
  const auto lengths{head.headers.get_all("Content-Length")};
  if (!lengths.empty()) {
    std::optional<std::size_t> length;
    for (const auto& value : lengths) {
      std::vector<std::string> parts;
      boost::algorithm::split(parts, value, boost::algorithm::is_any_of(","));
      for (auto& p : parts) {
        const auto n{parse_unsigned(boost::algorithm::trim_copy(p), 10)};
        if (!n || (length && *length != *n)) {
          throw malformed("invalid Content-Length '" + value + "'");
        }
        length = n;
      }
    }
    if (*length == 0) {
      return {body_framing::kind::none, 0};
    }
    return {body_framing::kind::length, *length};
  }
  return {body_framing::kind::until_close, 0};
}

auto keep_alive(const response_head& head) -> bool {
  if (head.headers.has_token("Connection", "close")) {
    return false;
  }
  if (head.version_minor == 0) {
    return head.headers.has_token("Connection", "keep-alive");
  }
  return true;
}

auto parse_chunk_size(std::string_view line) -> std::size_t {
  auto size{line.substr(0, line.find(';'))};
  while (!size.empty() && (size.back() == ' ' || size.back() == '\t')) {
    size.remove_suffix(1);
  }
  const auto n{parse_unsigned(size, 16)};
  if (!n) {
    throw malformed("invalid chunk size '" + std::string{line} + "'");
  }
  return *n;
}

auto chunk_prefix(std::size_t size) -> std::string {
  std::ostringstream out;
  out << std::hex << size << crlf;
  return out.str();
}

}	// end of namespace http
}	// end of namespace courier
