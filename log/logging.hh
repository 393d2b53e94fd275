#pragma once
#include <sstream>
#include <string>
#include <string_view>

// Stream style logging on top of spdlog:
//   LOG(INFO) << "connected to " << host << ENDL;
// The line is emitted when the statement ends. Disabled severities cost a
// single level check and never format their arguments.

namespace courier {
namespace log {

enum class severity {
  TRACE,
  DEBUG,
  INFO,
  WARNING,
  ERROR
};

struct end_line_t {};
inline constexpr end_line_t end_line{};

auto enabled(severity level) -> bool;

// Set the minimum severity that is written. Defaults to INFO, or to the
// value of the COURIER_LOG_LEVEL environment variable (trace, debug, info,
// warning, error, off) when it is set.
void set_level(severity level);
void disable();

auto parse_severity(std::string_view name, severity fallback) -> severity;

class line {
public:
  line(severity level, const char* file, int number);
  ~line();

  line(const line&) = delete;
  line& operator = (const line&) = delete;

  template<typename T>
  line& operator << (const T& value) {
    out << value;
    return *this;
  }

  line& operator << (end_line_t) {
    return *this;
  }

  line& operator << (std::ostream& (*manip)(std::ostream&)) {
    if (manip != static_cast<std::ostream& (*)(std::ostream&)>(std::endl)) {
      out << manip;
    }
    return *this;
  }

private:
  severity level;
  const char* file;
  int number;
  std::ostringstream out;
};

}	// end of namespace log
}	// end of namespace courier

#define LOG(level)                                                                   \
  if (!::courier::log::enabled(::courier::log::severity::level)) {                   \
  } else                                                                             \
    ::courier::log::line(::courier::log::severity::level, __FILE__, __LINE__)

#define ENDL ::courier::log::end_line
