// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "common/config.h"

#include <cstdlib>
#include <cstring>
#include <limits>

#include "common/fs_utils.h"
#include "sampling/event_descriptor.h"
#include "sampling/event_parser.h"

namespace perfscope {

namespace {

bool IsPowerOfTwo(uint64_t v) { return v != 0 && (v & (v - 1)) == 0; }

// Each reader returns false only when the variable is set but malformed
bool ReadUnsigned(const char* name, uint64_t max, uint64_t* out) {
  const char* env = std::getenv(name);
  if (env == nullptr) {
    return true;
  }
  uint64_t value = 0;
  if (!ParseUint64(env, 10, &value) || value > max) {
    return false;
  }
  *out = value;
  return true;
}

bool ReadTarget(const char* name, int* out) {
  const char* env = std::getenv(name);
  if (env == nullptr) {
    return true;
  }
  if (std::strcmp(env, "-1") == 0 || std::strcmp(env, "all") == 0) {
    *out = -1;
    return true;
  }
  uint64_t value = 0;
  if (!ParseUint64(env, 10, &value) ||
      value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
    return false;
  }
  *out = static_cast<int>(value);
  return true;
}

}  // namespace

const char* ToString(ConfigResult result) noexcept {
  switch (result) {
    case ConfigResult::kSuccess:
      return "ok";
    case ConfigResult::kInvalidValue:
      return "invalid value";
    case ConfigResult::kInvalidEvents:
      return "invalid event list";
    case ConfigResult::kConflictingSampling:
      return "sampling period and frequency are exclusive";
  }
  return "unknown";
}

ConfigResult ProfilerConfig::LoadFromEnvironment(std::string* bad_variable) {
  auto fail = [bad_variable](const char* name) {
    if (bad_variable != nullptr) {
      *bad_variable = name;
    }
    return ConfigResult::kInvalidValue;
  };

  const char* events_env = std::getenv("PERFSCOPE_EVENTS");
  if (events_env != nullptr) {
    events = events_env;
  }

  if (!ReadTarget("PERFSCOPE_PID", &pid)) return fail("PERFSCOPE_PID");
  if (!ReadTarget("PERFSCOPE_CPU", &cpu)) return fail("PERFSCOPE_CPU");

  const uint64_t u32_max = std::numeric_limits<uint32_t>::max();
  const uint64_t u64_max = std::numeric_limits<uint64_t>::max();
  uint64_t value = 0;

  if (!ReadUnsigned("PERFSCOPE_SAMPLING_PERIOD", u64_max, &sampling_period)) {
    return fail("PERFSCOPE_SAMPLING_PERIOD");
  }
  if (!ReadUnsigned("PERFSCOPE_SAMPLING_FREQ", u64_max,
                    &sampling_frequency)) {
    return fail("PERFSCOPE_SAMPLING_FREQ");
  }

  const char* aggregation_env = std::getenv("PERFSCOPE_AGGREGATION");
  if (aggregation_env != nullptr) {
    if (std::strcmp(aggregation_env, "flat") == 0) {
      aggregation = AggregationMode::kFlat;
    } else if (std::strcmp(aggregation_env, "tree") == 0) {
      aggregation = AggregationMode::kCallTree;
    } else {
      return fail("PERFSCOPE_AGGREGATION");
    }
  }

  const char* merge_env = std::getenv("PERFSCOPE_FRAME_MERGE");
  if (merge_env != nullptr) {
    if (std::strcmp(merge_env, "function") == 0) {
      frame_merge = FrameMergeMode::kFunction;
    } else if (std::strcmp(merge_env, "address") == 0) {
      frame_merge = FrameMergeMode::kAddress;
    } else {
      return fail("PERFSCOPE_FRAME_MERGE");
    }
  }

  const char* unwind_env = std::getenv("PERFSCOPE_UNWIND");
  if (unwind_env != nullptr) {
    if (std::strcmp(unwind_env, "fp") == 0) {
      unwind = UnwindMode::kFramePointer;
    } else if (std::strcmp(unwind_env, "dwarf") == 0) {
      unwind = UnwindMode::kDwarf;
    } else {
      return fail("PERFSCOPE_UNWIND");
    }
  }

  const char* resolved_env = std::getenv("PERFSCOPE_FLAT_FIRST_RESOLVED");
  if (resolved_env != nullptr) {
    flat_first_resolved = std::strcmp(resolved_env, "1") == 0;
  }

  value = poll_interval_ms;
  if (!ReadUnsigned("PERFSCOPE_POLL_INTERVAL_MS", u32_max, &value)) {
    return fail("PERFSCOPE_POLL_INTERVAL_MS");
  }
  poll_interval_ms = static_cast<uint32_t>(value);

  value = rotation_interval_ms;
  if (!ReadUnsigned("PERFSCOPE_ROTATION_INTERVAL_MS", u32_max, &value)) {
    return fail("PERFSCOPE_ROTATION_INTERVAL_MS");
  }
  rotation_interval_ms = static_cast<uint32_t>(value);

  value = buffer_pages;
  if (!ReadUnsigned("PERFSCOPE_BUFFER_PAGES", u32_max, &value)) {
    return fail("PERFSCOPE_BUFFER_PAGES");
  }
  buffer_pages = static_cast<uint32_t>(value);

  value = stack_dump_size;
  if (!ReadUnsigned("PERFSCOPE_STACK_DUMP_SIZE", u32_max, &value)) {
    return fail("PERFSCOPE_STACK_DUMP_SIZE");
  }
  stack_dump_size = static_cast<uint32_t>(value);

  value = max_stack_depth;
  if (!ReadUnsigned("PERFSCOPE_MAX_STACK_DEPTH", u32_max, &value)) {
    return fail("PERFSCOPE_MAX_STACK_DEPTH");
  }
  max_stack_depth = static_cast<uint32_t>(value);

  value = max_nodes;
  if (!ReadUnsigned("PERFSCOPE_MAX_NODES", u64_max, &value)) {
    return fail("PERFSCOPE_MAX_NODES");
  }
  max_nodes = static_cast<size_t>(value);

  value = hw_slots;
  if (!ReadUnsigned("PERFSCOPE_HW_SLOTS", u32_max, &value)) {
    return fail("PERFSCOPE_HW_SLOTS");
  }
  hw_slots = static_cast<uint32_t>(value);

  const char* tracefs_env = std::getenv("PERFSCOPE_TRACEFS");
  if (tracefs_env != nullptr) {
    tracefs_root = tracefs_env;
  }

  const char* level_env = std::getenv("PERFSCOPE_LOG_LEVEL");
  if (level_env != nullptr && !ParseLogLevel(level_env, &log_level)) {
    return fail("PERFSCOPE_LOG_LEVEL");
  }

  return Validate();
}

ConfigResult ProfilerConfig::Validate() const {
  if (sampling_period != 0 && sampling_frequency != 0) {
    return ConfigResult::kConflictingSampling;
  }
  if (events.empty()) {
    return ConfigResult::kInvalidEvents;
  }
  if (pid < -1 || cpu < -1 || (pid == -1 && cpu == -1)) {
    return ConfigResult::kInvalidValue;
  }
  if (!IsPowerOfTwo(buffer_pages)) {
    return ConfigResult::kInvalidValue;
  }
  if (stack_dump_size == 0 || stack_dump_size % 8 != 0 ||
      stack_dump_size > sampling::kMaxStackDumpSize) {
    return ConfigResult::kInvalidValue;
  }
  if (max_stack_depth == 0 ||
      max_stack_depth > std::numeric_limits<uint16_t>::max()) {
    return ConfigResult::kInvalidValue;
  }
  // Room for the root and the overflow bucket
  if (max_nodes < 2) {
    return ConfigResult::kInvalidValue;
  }
  if (poll_interval_ms == 0 || rotation_interval_ms == 0) {
    return ConfigResult::kInvalidValue;
  }
  return ConfigResult::kSuccess;
}

ConfigResult ProfilerConfig::BuildDescriptors(
    const sampling::EventParser& parser,
    std::vector<sampling::EventDescriptor>* descs, std::string* failed) const {
  ConfigResult result = Validate();
  if (result != ConfigResult::kSuccess) {
    return result;
  }

  std::vector<sampling::EventDescriptor> parsed;
  if (parser.parse_list(events, &parsed, failed) !=
      sampling::ParseResult::kSuccess) {
    return ConfigResult::kInvalidEvents;
  }

  uint32_t fields = sampling::kDefaultSampleFields;
  if (unwind == UnwindMode::kFramePointer) {
    fields |= sampling::kFieldCallchain;
  } else {
    fields |= sampling::kFieldStack;
  }

  for (auto& desc : parsed) {
    desc.set_pid(pid).set_cpu(cpu);
    if (sampling_frequency != 0) {
      desc.set_frequency(sampling_frequency);
    } else if (sampling_period != 0) {
      desc.set_period(sampling_period);
    }
    desc.add_fields(fields)
        .set_stack_dump_size(stack_dump_size)
        .set_max_callchain_depth(static_cast<uint16_t>(max_stack_depth));
    descs->push_back(desc);
  }
  return ConfigResult::kSuccess;
}

}  // namespace perfscope
