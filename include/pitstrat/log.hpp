#pragma once

namespace pitstrat {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Process-wide threshold; messages below it are dropped. Default: Warn.
void set_log_level(LogLevel lvl);
LogLevel log_level();

// printf-style line to stderr, prefixed with "[pitstrat] LEVEL ".
// No timestamps: identical runs produce identical logs.
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
void log_message(LogLevel lvl, const char* fmt, ...);

const char* log_level_name(LogLevel lvl);

} // namespace pitstrat
