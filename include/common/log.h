// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_COMMON_LOG_H_
#define PERFSCOPE_COMMON_LOG_H_

#include <cstdio>

// these macros can be used for colorful output
#define TPRT_NOCOLOR "\033[0m"
#define TPRT_RED "\033[1;31m"
#define TPRT_GREEN "\033[1;32m"
#define TPRT_YELLOW "\033[1;33m"
#define TPRT_BLUE "\033[1;34m"
#define TPRT_MAGENTA "\033[1;35m"
#define TPRT_CYAN "\033[1;36m"

namespace perfscope {

/// Severity of a log line. Lines above the process-wide level are dropped.
enum class LogLevel : int {
  kError = 0,
  kWarn = 1,
  kInfo = 2,
  kDebug = 3
};

/// Set the process-wide log level
void SetLogLevel(LogLevel level) noexcept;

/// Get the process-wide log level (default: kWarn)
LogLevel GetLogLevel() noexcept;

/// Parse "error", "warn", "info" or "debug"
/// @return true if the name was recognized
bool ParseLogLevel(const char* name, LogLevel* level) noexcept;

inline bool LogEnabled(LogLevel level) noexcept {
  return static_cast<int>(level) <= static_cast<int>(GetLogLevel());
}

}  // namespace perfscope

#define PERFSCOPE_LOG_AT(level, color, tag, fmt, ...)                         \
  do {                                                                        \
    if (::perfscope::LogEnabled(level)) {                                     \
      std::fprintf(stderr, color "[perfscope " tag "] " fmt TPRT_NOCOLOR "\n", \
                   ##__VA_ARGS__);                                            \
    }                                                                         \
  } while (false)

#define PERFSCOPE_LOG_ERROR(fmt, ...) \
  PERFSCOPE_LOG_AT(::perfscope::LogLevel::kError, TPRT_RED, "E", fmt, ##__VA_ARGS__)
#define PERFSCOPE_LOG_WARN(fmt, ...) \
  PERFSCOPE_LOG_AT(::perfscope::LogLevel::kWarn, TPRT_MAGENTA, "W", fmt, ##__VA_ARGS__)
#define PERFSCOPE_LOG_INFO(fmt, ...) \
  PERFSCOPE_LOG_AT(::perfscope::LogLevel::kInfo, TPRT_GREEN, "I", fmt, ##__VA_ARGS__)
#define PERFSCOPE_LOG_DEBUG(fmt, ...) \
  PERFSCOPE_LOG_AT(::perfscope::LogLevel::kDebug, TPRT_BLUE, "D", fmt, ##__VA_ARGS__)

#endif  // PERFSCOPE_COMMON_LOG_H_
