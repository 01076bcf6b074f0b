#pragma once

#include <fmt/format.h>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace simulor_native {

enum class LogLevel { trace = 0, debug, info, warn, error, off };

const char *to_string(LogLevel level);

// Accepts the names printed by to_string(). Throws std::invalid_argument
// for anything else.
LogLevel parse_log_level(std::string_view name);

using LogSink = std::function<void(LogLevel, const std::string &)>;

void set_log_level(LogLevel level);
LogLevel log_level();
bool should_log(LogLevel level);

// Replaces the stderr writer. Passing an empty sink restores stderr. The sink
// runs under the logger lock and must not log.
void set_log_sink(LogSink sink);

// Never throws; a sink or stderr failure drops the line.
void write_log(LogLevel level, const std::string &message);

template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args &&...args) {
  if (!should_log(level))
    return;
  write_log(level, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> format, Args &&...args) {
  log(LogLevel::debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(fmt::format_string<Args...> format, Args &&...args) {
  log(LogLevel::info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> format, Args &&...args) {
  log(LogLevel::warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
void log_error(fmt::format_string<Args...> format, Args &&...args) {
  log(LogLevel::error, format, std::forward<Args>(args)...);
}

} // namespace simulor_native
