// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_COMMON_CONFIG_H_
#define PERFSCOPE_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/log.h"

namespace perfscope {

namespace sampling {
class EventDescriptor;
class EventParser;
}  // namespace sampling

/// Shape of the aggregated profile
enum class AggregationMode { kFlat = 0, kCallTree = 1 };

/// Frame identity used when merging samples
enum class FrameMergeMode {
  kFunction = 0,  // same (module, symbol) is one frame
  kAddress = 1    // every distinct address is its own frame
};

/// How call stacks are recovered
enum class UnwindMode {
  kFramePointer = 0,  // kernel callchain
  kDwarf = 1          // user regs + stack copy, CFI unwinding
};

/// Configuration result codes
enum class ConfigResult {
  kSuccess = 0,
  kInvalidValue = 1,
  kInvalidEvents = 2,
  kConflictingSampling = 3
};

const char* ToString(ConfigResult result) noexcept;

/// Default values
constexpr const char* kDefaultEvents = "cpu-clock";
constexpr uint32_t kDefaultPollIntervalMs = 100;
constexpr uint32_t kDefaultRotationIntervalMs = 10;
constexpr uint32_t kDefaultBufferPages = 64;
constexpr uint32_t kDefaultConfigStackDumpSize = 8192;
constexpr uint32_t kDefaultMaxStackDepth = 127;
constexpr size_t kDefaultMaxNodes = 100000;

/// Configuration for a profiling run
struct ProfilerConfig {
  /// Comma separated event strings
  std::string events;

  /// Target process (0 = this process, -1 = every process)
  int pid;

  /// Target cpu (-1 = every online cpu)
  int cpu;

  /// Fixed sampling period (0 = unset)
  uint64_t sampling_period;

  /// Sampling frequency in Hz (0 = unset). Exclusive with the period.
  uint64_t sampling_frequency;

  AggregationMode aggregation;
  FrameMergeMode frame_merge;
  UnwindMode unwind;

  /// Flat mode charges the first resolved frame instead of the leaf
  bool flat_first_resolved;

  /// Timeout of one poll on the ring buffers
  uint32_t poll_interval_ms;

  /// Multiplexing rotation interval
  uint32_t rotation_interval_ms;

  /// Data pages per ring buffer, a power of two
  uint32_t buffer_pages;

  /// Bytes of user stack copied per sample (dwarf unwinding)
  uint32_t stack_dump_size;

  /// Deepest call stack kept per sample
  uint32_t max_stack_depth;

  /// Node cap per aggregator shard and merged profile
  size_t max_nodes;

  /// Hardware counter slots (0 = discover)
  uint32_t hw_slots;

  /// Tracefs mount point (empty = autodetect)
  std::string tracefs_root;

  LogLevel log_level;

  /// Default constructor with sensible defaults
  ProfilerConfig()
      : events(kDefaultEvents),
        pid(0),
        cpu(-1),
        sampling_period(0),
        sampling_frequency(0),
        aggregation(AggregationMode::kCallTree),
        frame_merge(FrameMergeMode::kFunction),
        unwind(UnwindMode::kFramePointer),
        flat_first_resolved(false),
        poll_interval_ms(kDefaultPollIntervalMs),
        rotation_interval_ms(kDefaultRotationIntervalMs),
        buffer_pages(kDefaultBufferPages),
        stack_dump_size(kDefaultConfigStackDumpSize),
        max_stack_depth(kDefaultMaxStackDepth),
        max_nodes(kDefaultMaxNodes),
        hw_slots(0),
        log_level(LogLevel::kWarn) {}

  /// Override fields from PERFSCOPE_* environment variables.
  /// Unset variables leave the field untouched.
  /// @param bad_variable Receives the name of the first malformed variable
  ConfigResult LoadFromEnvironment(std::string* bad_variable = nullptr);

  /// Check ranges and exclusive options
  ConfigResult Validate() const;

  /// Parse the event list and apply scope, sampling and record fields
  /// @param failed Receives the first event string that did not parse
  ConfigResult BuildDescriptors(const sampling::EventParser& parser,
                                std::vector<sampling::EventDescriptor>* descs,
                                std::string* failed = nullptr) const;
};

}  // namespace perfscope

#endif  // PERFSCOPE_COMMON_CONFIG_H_
