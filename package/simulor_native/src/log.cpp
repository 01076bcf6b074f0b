#include "simulor_native/log.hpp"
#include "simulor_native/config.hpp"

#include <cstdio>
#include <mutex>
#include <stdexcept>

namespace simulor_native {

namespace {

struct LoggerState {
  std::mutex mutex;
  LogLevel level{build_config().log_level};
  LogSink sink;
};

LoggerState &logger() {
  static LoggerState state;
  return state;
}

} // namespace

const char *to_string(LogLevel level) {
  switch (level) {
  case LogLevel::trace:
    return "trace";
  case LogLevel::debug:
    return "debug";
  case LogLevel::info:
    return "info";
  case LogLevel::warn:
    return "warn";
  case LogLevel::error:
    return "error";
  case LogLevel::off:
    return "off";
  }
  return "unknown";
}

LogLevel parse_log_level(std::string_view name) {
  for (LogLevel level : {LogLevel::trace, LogLevel::debug, LogLevel::info,
                         LogLevel::warn, LogLevel::error, LogLevel::off}) {
    if (name == to_string(level))
      return level;
  }
  throw std::invalid_argument(fmt::format("unknown log level '{}'", name));
}

void set_log_level(LogLevel level) {
  LoggerState &st = logger();
  std::lock_guard<std::mutex> lock(st.mutex);
  st.level = level;
}

LogLevel log_level() {
  LoggerState &st = logger();
  std::lock_guard<std::mutex> lock(st.mutex);
  return st.level;
}

bool should_log(LogLevel level) {
  return level != LogLevel::off && level >= log_level();
}

void set_log_sink(LogSink sink) {
  LoggerState &st = logger();
  std::lock_guard<std::mutex> lock(st.mutex);
  st.sink = std::move(sink);
}

void write_log(LogLevel level, const std::string &message) {
  LoggerState &st = logger();
  std::lock_guard<std::mutex> lock(st.mutex);
  // Logging never fails the caller: a line that cannot be written is dropped.
  try {
    if (st.sink) {
      st.sink(level, message);
      return;
    }
    fmt::print(stderr, "[{}] [{}] {}\n", build_config().module_name,
               to_string(level), message);
  } catch (const std::exception &) {
  }
}

} // namespace simulor_native
