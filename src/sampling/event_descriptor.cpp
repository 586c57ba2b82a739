// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "sampling/event_descriptor.h"

#include <cstring>
#include <utility>

#include "sampling/perf_regs.h"

namespace perfscope {
namespace sampling {

const char* ToString(DescriptorError error) noexcept {
  switch (error) {
    case DescriptorError::kNone:
      return "ok";
    case DescriptorError::kUnknownHardwareEvent:
      return "unknown hardware event";
    case DescriptorError::kUnknownSoftwareEvent:
      return "unknown software event";
    case DescriptorError::kZeroSamplingValue:
      return "zero sampling period or frequency";
    case DescriptorError::kInvalidScope:
      return "invalid pid/cpu scope";
    case DescriptorError::kInvalidStackDumpSize:
      return "invalid user stack dump size";
    case DescriptorError::kInvalidPreciseLevel:
      return "precise level out of range";
    case DescriptorError::kUnknownSampleField:
      return "unknown sample field";
    case DescriptorError::kUnsupportedFieldCombination:
      return "unsupported sample field combination";
  }
  return "unknown";
}

EventDescriptor::EventDescriptor() noexcept
    : kind_(EventKind::kSoftware),
      config_(PERF_COUNT_SW_CPU_CLOCK),
      sampling_mode_(SamplingMode::kPeriod),
      sampling_value_(kDefaultSamplePeriod),
      pid_(0),
      cpu_(kAllTargets),
      fields_(kDefaultSampleFields),
      stack_dump_size_(kDefaultStackDumpSize),
      max_callchain_depth_(kDefaultMaxCallchainDepth) {}

EventDescriptor EventDescriptor::Hardware(uint64_t config) {
  EventDescriptor desc;
  desc.kind_ = EventKind::kHardware;
  desc.config_ = config;
  return desc;
}

EventDescriptor EventDescriptor::Software(uint64_t config) {
  EventDescriptor desc;
  desc.kind_ = EventKind::kSoftware;
  desc.config_ = config;
  return desc;
}

EventDescriptor EventDescriptor::Tracepoint(uint64_t tracepoint_id) {
  EventDescriptor desc;
  desc.kind_ = EventKind::kTracepoint;
  desc.config_ = tracepoint_id;
  // Every tracepoint hit is interesting by default
  desc.sampling_value_ = 1;
  return desc;
}

EventDescriptor EventDescriptor::Raw(uint64_t config) {
  EventDescriptor desc;
  desc.kind_ = EventKind::kRaw;
  desc.config_ = config;
  return desc;
}

EventDescriptor& EventDescriptor::set_name(std::string name) {
  name_ = std::move(name);
  return *this;
}

EventDescriptor& EventDescriptor::set_kind(EventKind kind) noexcept {
  kind_ = kind;
  return *this;
}

EventDescriptor& EventDescriptor::set_config(uint64_t config) noexcept {
  config_ = config;
  return *this;
}

EventDescriptor& EventDescriptor::set_period(uint64_t period) noexcept {
  sampling_mode_ = SamplingMode::kPeriod;
  sampling_value_ = period;
  return *this;
}

EventDescriptor& EventDescriptor::set_frequency(uint64_t hz) noexcept {
  sampling_mode_ = SamplingMode::kFrequency;
  sampling_value_ = hz;
  return *this;
}

EventDescriptor& EventDescriptor::set_pid(int pid) noexcept {
  pid_ = pid;
  return *this;
}

EventDescriptor& EventDescriptor::set_cpu(int cpu) noexcept {
  cpu_ = cpu;
  return *this;
}

EventDescriptor& EventDescriptor::set_fields(uint32_t fields) noexcept {
  fields_ = fields;
  return *this;
}

EventDescriptor& EventDescriptor::add_fields(uint32_t fields) noexcept {
  fields_ |= fields;
  return *this;
}

EventDescriptor& EventDescriptor::set_modifiers(
    const EventModifiers& modifiers) noexcept {
  modifiers_ = modifiers;
  return *this;
}

EventDescriptor& EventDescriptor::set_stack_dump_size(uint32_t bytes) noexcept {
  stack_dump_size_ = bytes;
  return *this;
}

EventDescriptor& EventDescriptor::set_max_callchain_depth(
    uint16_t depth) noexcept {
  max_callchain_depth_ = depth;
  return *this;
}

DescriptorError EventDescriptor::validate() const noexcept {
  switch (kind_) {
    case EventKind::kHardware:
      // The upper half may carry an extended PMU type on hybrid systems
      if ((config_ & 0xffffffffULL) >= PERF_COUNT_HW_MAX) {
        return DescriptorError::kUnknownHardwareEvent;
      }
      break;
    case EventKind::kSoftware:
      if (config_ >= PERF_COUNT_SW_MAX) {
        return DescriptorError::kUnknownSoftwareEvent;
      }
      break;
    case EventKind::kTracepoint:
    case EventKind::kRaw:
      break;
  }

  if (sampling_value_ == 0) {
    return DescriptorError::kZeroSamplingValue;
  }
  if (pid_ < kAllTargets || cpu_ < kAllTargets ||
      (pid_ == kAllTargets && cpu_ == kAllTargets)) {
    return DescriptorError::kInvalidScope;
  }
  if (modifiers_.precise_ip > 3) {
    return DescriptorError::kInvalidPreciseLevel;
  }
  if ((fields_ & ~kAllSampleFields) != 0) {
    return DescriptorError::kUnknownSampleField;
  }
  if (has_field(kFieldStack)) {
    if (kUnwindRegisterMask == 0) {
      return DescriptorError::kUnsupportedFieldCombination;
    }
    if (stack_dump_size_ == 0 || stack_dump_size_ % 8 != 0 ||
        stack_dump_size_ > kMaxStackDumpSize) {
      return DescriptorError::kInvalidStackDumpSize;
    }
  }
  // Raw payloads only exist for tracepoints and PMU-specific raw events
  if (has_field(kFieldRaw) && kind_ != EventKind::kTracepoint &&
      kind_ != EventKind::kRaw) {
    return DescriptorError::kUnsupportedFieldCombination;
  }
  // Excluding every privilege level can never produce a sample
  if (modifiers_.exclude_user && modifiers_.exclude_kernel &&
      modifiers_.exclude_hv) {
    return DescriptorError::kUnsupportedFieldCombination;
  }
  return DescriptorError::kNone;
}

perf_event_attr EventDescriptor::to_attr() const noexcept {
  perf_event_attr attr;
  std::memset(&attr, 0, sizeof(attr));
  attr.size = sizeof(attr);

  switch (kind_) {
    case EventKind::kHardware:
      attr.type = PERF_TYPE_HARDWARE;
      break;
    case EventKind::kSoftware:
      attr.type = PERF_TYPE_SOFTWARE;
      break;
    case EventKind::kTracepoint:
      attr.type = PERF_TYPE_TRACEPOINT;
      break;
    case EventKind::kRaw:
      attr.type = PERF_TYPE_RAW;
      break;
  }
  attr.config = config_;

  if (sampling_mode_ == SamplingMode::kFrequency) {
    attr.freq = 1;
    attr.sample_freq = sampling_value_;
  } else {
    attr.sample_period = sampling_value_;
  }

  uint64_t sample_type = PERF_SAMPLE_IDENTIFIER;
  if (has_field(kFieldIp)) sample_type |= PERF_SAMPLE_IP;
  if (has_field(kFieldTid)) sample_type |= PERF_SAMPLE_TID;
  if (has_field(kFieldTime)) sample_type |= PERF_SAMPLE_TIME;
  if (has_field(kFieldAddr)) sample_type |= PERF_SAMPLE_ADDR;
  if (has_field(kFieldCpu)) sample_type |= PERF_SAMPLE_CPU;
  // In frequency mode the kernel picks the period, so every sample carries it
  if (has_field(kFieldPeriod) || sampling_mode_ == SamplingMode::kFrequency) {
    sample_type |= PERF_SAMPLE_PERIOD;
  }
  if (has_field(kFieldRaw)) sample_type |= PERF_SAMPLE_RAW;
  if (has_field(kFieldCallchain)) {
    sample_type |= PERF_SAMPLE_CALLCHAIN;
    attr.sample_max_stack = max_callchain_depth_;
  }
  if (has_field(kFieldBranchStack)) {
    sample_type |= PERF_SAMPLE_BRANCH_STACK;
    attr.branch_sample_type = PERF_SAMPLE_BRANCH_ANY;
  }
  if (has_field(kFieldStack)) {
    sample_type |= PERF_SAMPLE_REGS_USER | PERF_SAMPLE_STACK_USER;
    attr.sample_regs_user = kUnwindRegisterMask;
    attr.sample_stack_user = stack_dump_size_;
  }
  if (has_field(kFieldRead)) {
    sample_type |= PERF_SAMPLE_READ;
    attr.read_format = PERF_FORMAT_TOTAL_TIME_ENABLED |
                       PERF_FORMAT_TOTAL_TIME_RUNNING | PERF_FORMAT_ID;
  }
  attr.sample_type = sample_type;

  attr.disabled = 1;
  attr.exclude_user = modifiers_.exclude_user ? 1 : 0;
  attr.exclude_kernel = modifiers_.exclude_kernel ? 1 : 0;
  attr.exclude_hv = modifiers_.exclude_hv ? 1 : 0;
  attr.exclude_idle = modifiers_.exclude_idle ? 1 : 0;
  attr.exclude_host = modifiers_.exclude_host ? 1 : 0;
  attr.exclude_guest = modifiers_.exclude_guest ? 1 : 0;
  attr.precise_ip = modifiers_.precise_ip;
  attr.pinned = modifiers_.pinned ? 1 : 0;
  attr.exclusive = modifiers_.exclusive ? 1 : 0;
  return attr;
}

SampleLayout EventDescriptor::layout() const noexcept {
  const perf_event_attr attr = to_attr();
  SampleLayout layout;
  layout.sample_type = attr.sample_type;
  layout.read_format = attr.read_format;
  layout.regs_user_mask = attr.sample_regs_user;
  layout.branch_sample_type = attr.branch_sample_type;
  return layout;
}

}  // namespace sampling
}  // namespace perfscope
