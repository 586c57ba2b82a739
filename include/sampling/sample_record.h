// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_SAMPLING_SAMPLE_RECORD_H_
#define PERFSCOPE_SAMPLING_SAMPLE_RECORD_H_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace perfscope {
namespace sampling {

/// SampleLayout captures everything needed to parse the samples of one
/// descriptor. It is fixed when the descriptor is opened.
struct SampleLayout {
  uint64_t sample_type = 0;         // PERF_SAMPLE_* bits
  uint64_t read_format = 0;         // PERF_FORMAT_* bits
  uint64_t regs_user_mask = 0;      // attr.sample_regs_user
  uint64_t branch_sample_type = 0;  // attr.branch_sample_type
};

/// One PERF_SAMPLE_BRANCH_STACK entry
struct BranchEntry {
  uint64_t from;
  uint64_t to;
  uint64_t flags;
};

/// Unaligned little helper for views into record bytes
inline uint64_t LoadU64(const uint8_t* p) noexcept {
  uint64_t v;
  std::memcpy(&v, p, sizeof(v));
  return v;
}

/// SampleRecord holds the decoded fields of one PERF_RECORD_SAMPLE.
///
/// One instance is reused for every record a drain task decodes. The
/// variable-length members are views into the record bytes and stay valid
/// only until the next record is drained.
struct SampleRecord {
  /// sample_type of the layout the record was decoded with
  uint64_t present = 0;

  uint64_t identifier = 0;
  uint64_t ip = 0;
  uint32_t pid = 0;
  uint32_t tid = 0;
  uint64_t time = 0;
  uint64_t addr = 0;
  uint64_t id = 0;
  uint64_t stream_id = 0;
  uint32_t cpu = 0;
  uint64_t period = 0;

  // PERF_SAMPLE_READ, kept raw because its shape depends on read_format
  const uint8_t* read_data = nullptr;
  size_t read_size = 0;

  // PERF_SAMPLE_CALLCHAIN
  const uint8_t* callchain_data = nullptr;
  uint64_t callchain_nr = 0;

  // PERF_SAMPLE_RAW
  const uint8_t* raw_data = nullptr;
  uint32_t raw_size = 0;

  // PERF_SAMPLE_BRANCH_STACK
  const uint8_t* branch_data = nullptr;
  uint64_t branch_nr = 0;
  uint64_t branch_hw_index = 0;

  // PERF_SAMPLE_REGS_USER
  uint64_t regs_abi = 0;
  const uint8_t* regs_data = nullptr;
  uint32_t regs_count = 0;

  // PERF_SAMPLE_STACK_USER
  const uint8_t* stack_data = nullptr;
  uint64_t stack_size = 0;
  uint64_t stack_dyn_size = 0;

  uint64_t weight = 0;
  uint64_t data_src = 0;
  uint64_t transaction = 0;

  bool has(uint64_t sample_bit) const noexcept {
    return (present & sample_bit) != 0;
  }

  uint64_t callchain_at(size_t i) const noexcept {
    return LoadU64(callchain_data + i * sizeof(uint64_t));
  }

  BranchEntry branch_at(size_t i) const noexcept {
    BranchEntry entry;
    std::memcpy(&entry, branch_data + i * sizeof(BranchEntry), sizeof(entry));
    return entry;
  }

  /// Register value at a packed position (mask bit order)
  uint64_t reg_at(size_t i) const noexcept {
    return LoadU64(regs_data + i * sizeof(uint64_t));
  }

  /// Bytes of user stack that are actually valid
  uint64_t valid_stack_size() const noexcept {
    return stack_dyn_size < stack_size ? stack_dyn_size : stack_size;
  }

  void reset() noexcept { *this = SampleRecord(); }
};

/// PERF_RECORD_MMAP / PERF_RECORD_MMAP2
struct MmapEvent {
  uint32_t pid = 0;
  uint32_t tid = 0;
  uint64_t start = 0;
  uint64_t length = 0;
  uint64_t pgoff = 0;
  bool executable = false;
  std::string_view filename;
};

/// PERF_RECORD_COMM
struct CommEvent {
  uint32_t pid = 0;
  uint32_t tid = 0;
  bool exec = false;
  std::string_view comm;
};

/// PERF_RECORD_EXIT (and PERF_RECORD_FORK, which shares its layout)
struct TaskEvent {
  uint32_t pid = 0;
  uint32_t ppid = 0;
  uint32_t tid = 0;
  uint32_t ptid = 0;
  uint64_t time = 0;
};

/// PERF_RECORD_LOST
struct LostEvent {
  uint64_t id = 0;
  uint64_t lost = 0;
};

/// PERF_RECORD_THROTTLE / PERF_RECORD_UNTHROTTLE
struct ThrottleEvent {
  uint64_t time = 0;
  uint64_t id = 0;
  uint64_t stream_id = 0;
  bool throttled = true;
};

}  // namespace sampling
}  // namespace perfscope

#endif  // PERFSCOPE_SAMPLING_SAMPLE_RECORD_H_
