#include <pitstrat/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace pitstrat {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
static std::mutex g_log_mutex;

void set_log_level(LogLevel lvl) {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

const char* log_level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "?";
}

void log_message(LogLevel lvl, const char* fmt, ...) {
  if (lvl == LogLevel::Off) return;
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;

  char buf[1024];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::fprintf(stderr, "[pitstrat] %-5s %s\n", log_level_name(lvl), buf);
}

} // namespace pitstrat
