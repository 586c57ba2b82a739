// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_SAMPLING_EVENT_DESCRIPTOR_H_
#define PERFSCOPE_SAMPLING_EVENT_DESCRIPTOR_H_

#include <linux/perf_event.h>

#include <cstdint>
#include <string>

#include "sampling/sample_record.h"

namespace perfscope {
namespace sampling {

/// Scope value meaning "every process" or "every cpu"
constexpr int kAllTargets = -1;

/// Default sampling period (events between two samples)
constexpr uint64_t kDefaultSamplePeriod = 1000000;

/// Default bytes of user stack copied per sample
constexpr uint32_t kDefaultStackDumpSize = 8192;

/// Largest user stack copy the sample header can describe
constexpr uint32_t kMaxStackDumpSize = 65528;

/// Default callchain depth requested from the kernel
constexpr uint16_t kDefaultMaxCallchainDepth = 127;

/// EventKind selects the perf_event_attr type
enum class EventKind : uint8_t {
  kHardware = 0,    // PERF_TYPE_HARDWARE
  kSoftware = 1,    // PERF_TYPE_SOFTWARE
  kTracepoint = 2,  // PERF_TYPE_TRACEPOINT, config is the tracefs id
  kRaw = 3          // PERF_TYPE_RAW, config is a PMU-specific encoding
};

/// Trigger condition of a sampling event
enum class SamplingMode : uint8_t {
  kPeriod = 0,    // one sample every N events
  kFrequency = 1  // kernel adjusts the period to reach N samples per second
};

/// Record fields a descriptor can request. Combined as a bitmask.
enum SampleField : uint32_t {
  kFieldIp = 1u << 0,
  kFieldTid = 1u << 1,
  kFieldTime = 1u << 2,
  kFieldAddr = 1u << 3,
  kFieldCpu = 1u << 4,
  kFieldPeriod = 1u << 5,
  kFieldCallchain = 1u << 6,
  kFieldRaw = 1u << 7,
  kFieldBranchStack = 1u << 8,
  kFieldStack = 1u << 9,  // user registers plus a copy of the user stack
  kFieldRead = 1u << 10
};

constexpr uint32_t kDefaultSampleFields =
    kFieldIp | kFieldTid | kFieldTime | kFieldCpu | kFieldPeriod;

constexpr uint32_t kAllSampleFields = (kFieldRead << 1) - 1;

/// Counting modifiers, as written after ':' in an event string
struct EventModifiers {
  bool exclude_user = false;
  bool exclude_kernel = false;
  bool exclude_hv = false;
  bool exclude_idle = false;
  bool exclude_host = false;
  bool exclude_guest = false;
  uint8_t precise_ip = 0;    // 0..3
  bool max_precise = false;  // probe downward from 3 at open time
  bool pinned = false;
  bool exclusive = false;
  bool weak_group = false;
};

/// Reasons a descriptor fails validation
enum class DescriptorError {
  kNone = 0,
  kUnknownHardwareEvent = 1,
  kUnknownSoftwareEvent = 2,
  kZeroSamplingValue = 3,
  kInvalidScope = 4,
  kInvalidStackDumpSize = 5,
  kInvalidPreciseLevel = 6,
  kUnknownSampleField = 7,
  kUnsupportedFieldCombination = 8
};

const char* ToString(DescriptorError error) noexcept;

/// EventDescriptor is the validated description of one counter or
/// tracepoint to monitor. The session keeps its own const copy once opened.
class EventDescriptor {
 public:
  EventDescriptor() noexcept;

  static EventDescriptor Hardware(uint64_t config);
  static EventDescriptor Software(uint64_t config);
  static EventDescriptor Tracepoint(uint64_t tracepoint_id);
  static EventDescriptor Raw(uint64_t config);

  EventDescriptor& set_name(std::string name);
  EventDescriptor& set_kind(EventKind kind) noexcept;
  EventDescriptor& set_config(uint64_t config) noexcept;
  EventDescriptor& set_period(uint64_t period) noexcept;
  EventDescriptor& set_frequency(uint64_t hz) noexcept;
  EventDescriptor& set_pid(int pid) noexcept;
  EventDescriptor& set_cpu(int cpu) noexcept;
  EventDescriptor& set_fields(uint32_t fields) noexcept;
  EventDescriptor& add_fields(uint32_t fields) noexcept;
  EventDescriptor& set_modifiers(const EventModifiers& modifiers) noexcept;
  EventDescriptor& set_stack_dump_size(uint32_t bytes) noexcept;
  EventDescriptor& set_max_callchain_depth(uint16_t depth) noexcept;

  const std::string& name() const noexcept { return name_; }
  EventKind kind() const noexcept { return kind_; }
  uint64_t config() const noexcept { return config_; }
  SamplingMode sampling_mode() const noexcept { return sampling_mode_; }
  /// Period in events (kPeriod) or frequency in Hz (kFrequency)
  uint64_t sampling_value() const noexcept { return sampling_value_; }
  int pid() const noexcept { return pid_; }
  int cpu() const noexcept { return cpu_; }
  uint32_t fields() const noexcept { return fields_; }
  bool has_field(SampleField field) const noexcept {
    return (fields_ & field) != 0;
  }
  const EventModifiers& modifiers() const noexcept { return modifiers_; }
  uint32_t stack_dump_size() const noexcept { return stack_dump_size_; }
  uint16_t max_callchain_depth() const noexcept { return max_callchain_depth_; }

  /// Hardware descriptors occupy a counter slot while enabled
  bool uses_hardware_slot() const noexcept {
    return kind_ == EventKind::kHardware || kind_ == EventKind::kRaw;
  }

  /// Check the descriptor against what the platform can express
  DescriptorError validate() const noexcept;

  /// Build the perf_event_attr for this descriptor. The event is created
  /// disabled and always carries PERF_SAMPLE_IDENTIFIER.
  perf_event_attr to_attr() const noexcept;

  /// Field layout of the samples this descriptor produces
  SampleLayout layout() const noexcept;

 private:
  std::string name_;
  EventKind kind_;
  uint64_t config_;
  SamplingMode sampling_mode_;
  uint64_t sampling_value_;
  int pid_;
  int cpu_;
  uint32_t fields_;
  EventModifiers modifiers_;
  uint32_t stack_dump_size_;
  uint16_t max_callchain_depth_;
};

}  // namespace sampling
}  // namespace perfscope

#endif  // PERFSCOPE_SAMPLING_EVENT_DESCRIPTOR_H_
