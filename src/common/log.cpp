// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "common/log.h"

#include <atomic>
#include <cstring>

namespace perfscope {

namespace {
std::atomic<int> g_log_level{static_cast<int>(LogLevel::kWarn)};
}  // namespace

void SetLogLevel(LogLevel level) noexcept {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel GetLogLevel() noexcept {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool ParseLogLevel(const char* name, LogLevel* level) noexcept {
  if (name == nullptr || level == nullptr) {
    return false;
  }
  if (std::strcmp(name, "error") == 0) {
    *level = LogLevel::kError;
  } else if (std::strcmp(name, "warn") == 0) {
    *level = LogLevel::kWarn;
  } else if (std::strcmp(name, "info") == 0) {
    *level = LogLevel::kInfo;
  } else if (std::strcmp(name, "debug") == 0) {
    *level = LogLevel::kDebug;
  } else {
    return false;
  }
  return true;
}

}  // namespace perfscope
