#pragma once
#include <cstdint>

namespace pixy {

enum class LogLevel : uint8_t {
  DEBUG,
  INFO,
  WARN,
  ERROR,
};

void set_log_level(LogLevel level);
LogLevel log_level();

const char* log_level_name(LogLevel level);
bool parse_log_level(const char* text, LogLevel& out);

// printf-style line with a "[component]" prefix. WARN and ERROR go to
// stderr, everything else to stdout. Lines from different threads never
// interleave.
void logf(LogLevel level, const char* component, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace pixy
