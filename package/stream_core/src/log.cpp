#include "stream_core/log.hpp"

#include <atomic>
#include <cstdio>

namespace stream_core {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

const char *level_tag(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "Debug";
  case LogLevel::Info:
    return "Info";
  case LogLevel::Warn:
    return "Warn";
  case LogLevel::Error:
    return "Error";
  }
  return "Info";
}

} // namespace

void set_log_level(LogLevel level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void log_line(LogLevel level, const std::string &msg) {
  if (static_cast<int>(level) < g_level.load(std::memory_order_relaxed))
    return;
  fmt::print(stderr, "[{}] {}\n", level_tag(level), msg);
}

} // namespace stream_core
