#pragma once

#include <string>
#include <utility>

#include <fmt/format.h>

namespace stream_core {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();

// Writes "[Tag] msg" to stderr when level passes the threshold.
void log_line(LogLevel level, const std::string &msg);

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args &&...args) {
  if (log_level() > LogLevel::Debug)
    return;
  log_line(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args &&...args) {
  if (log_level() > LogLevel::Info)
    return;
  log_line(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args &&...args) {
  if (log_level() > LogLevel::Warn)
    return;
  log_line(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args &&...args) {
  log_line(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace stream_core
