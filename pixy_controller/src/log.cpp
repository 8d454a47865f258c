#include "log.hpp"
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace pixy {

static std::atomic<uint8_t> g_level{(uint8_t)LogLevel::INFO};
static std::mutex g_log_mutex;

void set_log_level(LogLevel level) {
  g_level.store((uint8_t)level);
}

LogLevel log_level() {
  return (LogLevel)g_level.load();
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "debug";
    case LogLevel::INFO: return "info";
    case LogLevel::WARN: return "warn";
    case LogLevel::ERROR: return "error";
  }
  return "(unknown)";
}

bool parse_log_level(const char* text, LogLevel& out) {
  if (!text || !text[0]) return false;
  if (std::strcmp(text, "debug") == 0) { out = LogLevel::DEBUG; return true; }
  if (std::strcmp(text, "info") == 0) { out = LogLevel::INFO; return true; }
  if (std::strcmp(text, "warn") == 0) { out = LogLevel::WARN; return true; }
  if (std::strcmp(text, "error") == 0) { out = LogLevel::ERROR; return true; }
  return false;
}

void logf(LogLevel level, const char* component, const char* fmt, ...) {
  if ((uint8_t)level < g_level.load()) return;

  char msg[512];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  FILE* out = (level >= LogLevel::WARN) ? stderr : stdout;
  const char* label = "";
  if (level == LogLevel::WARN) label = "WARN: ";
  else if (level == LogLevel::ERROR) label = "ERROR: ";

  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::fprintf(out, "[%s] %s%s\n", component ? component : "pixy", label, msg);
  std::fflush(out);
}

} // namespace pixy
