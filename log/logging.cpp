#include "log/logging.hh"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <boost/algorithm/string.hpp>
#include <cstdlib>
#include <memory>
#include <mutex>

namespace courier {
namespace log {
namespace {

auto to_spdlog(severity level) -> spdlog::level::level_enum {
  switch (level) {
    case severity::TRACE:
      return spdlog::level::trace;
    case severity::DEBUG:
      return spdlog::level::debug;
    case severity::INFO:
      return spdlog::level::info;
    case severity::WARNING:
      return spdlog::level::warn;
    case severity::ERROR:
      return spdlog::level::err;
  }
  return spdlog::level::info;
}

auto logger() -> spdlog::logger& {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(once, [] {
    instance = spdlog::stderr_color_mt("courier");
    instance->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
    instance->set_level(spdlog::level::info);
    if (const char* env = std::getenv("COURIER_LOG_LEVEL"); env) {
      if (boost::algorithm::iequals(env, "off")) {
        instance->set_level(spdlog::level::off);
      } else {
        instance->set_level(to_spdlog(parse_severity(env, severity::INFO)));
      }
    }
  });
  return *instance;
}

auto base_name(const char* path) -> const char* {
  const char* name = path;
  for (const char* p = path; *p; ++p) {
    if (*p == '/' || *p == '\\') {
      name = p + 1;
    }
  }
  return name;
}

}		// end of local namespace

auto parse_severity(std::string_view name, severity fallback) -> severity {
  const std::string n{name};
  if (boost::algorithm::iequals(n, "trace")) {
    return severity::TRACE;
  } else if (boost::algorithm::iequals(n, "debug")) {
    return severity::DEBUG;
  } else if (boost::algorithm::iequals(n, "info")) {
    return severity::INFO;
  } else if (boost::algorithm::iequals(n, "warning") || boost::algorithm::iequals(n, "warn")) {
    return severity::WARNING;
  } else if (boost::algorithm::iequals(n, "error")) {
    return severity::ERROR;
  }
  return fallback;
}

auto enabled(severity level) -> bool {
  return logger().should_log(to_spdlog(level));
}

void set_level(severity level) {
  logger().set_level(to_spdlog(level));
}

void disable() {
  logger().set_level(spdlog::level::off);
}

line::line(severity l, const char* f, int n) : level{l}, file{f}, number{n} {
}

line::~line() {
  logger().log(spdlog::source_loc{base_name(file), number, ""}, to_spdlog(level), "{}", out.str());
}

}	// end of namespace log
}	// end of namespace courier
