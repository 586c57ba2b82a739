// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_SAMPLING_PERF_REGS_H_
#define PERFSCOPE_SAMPLING_PERF_REGS_H_

#include <asm/perf_regs.h>

#include <cstdint>

#include "sampling/sample_record.h"

namespace perfscope {
namespace sampling {

#if defined(__x86_64__)

/// General purpose registers sampled with the user stack
constexpr uint64_t kUnwindRegisterMask =
    (1ULL << PERF_REG_X86_AX) | (1ULL << PERF_REG_X86_BX) |
    (1ULL << PERF_REG_X86_CX) | (1ULL << PERF_REG_X86_DX) |
    (1ULL << PERF_REG_X86_SI) | (1ULL << PERF_REG_X86_DI) |
    (1ULL << PERF_REG_X86_BP) | (1ULL << PERF_REG_X86_SP) |
    (1ULL << PERF_REG_X86_IP) | (1ULL << PERF_REG_X86_R8) |
    (1ULL << PERF_REG_X86_R9) | (1ULL << PERF_REG_X86_R10) |
    (1ULL << PERF_REG_X86_R11) | (1ULL << PERF_REG_X86_R12) |
    (1ULL << PERF_REG_X86_R13) | (1ULL << PERF_REG_X86_R14) |
    (1ULL << PERF_REG_X86_R15);

constexpr int kPerfRegFramePointer = PERF_REG_X86_BP;
constexpr int kPerfRegStackPointer = PERF_REG_X86_SP;
constexpr int kPerfRegInstructionPointer = PERF_REG_X86_IP;

#elif defined(__aarch64__)

/// x0..x28, fp, lr, sp and pc
constexpr uint64_t kUnwindRegisterMask = (1ULL << PERF_REG_ARM64_MAX) - 1;

constexpr int kPerfRegFramePointer = PERF_REG_ARM64_X29;
constexpr int kPerfRegStackPointer = PERF_REG_ARM64_SP;
constexpr int kPerfRegInstructionPointer = PERF_REG_ARM64_PC;

#else

// No user register capture on other architectures
constexpr uint64_t kUnwindRegisterMask = 0;

constexpr int kPerfRegFramePointer = -1;
constexpr int kPerfRegStackPointer = -1;
constexpr int kPerfRegInstructionPointer = -1;

#endif

/// Read one sampled user register.
/// The kernel packs the registers in ascending bit order of the mask.
/// @param sample Decoded sample with PERF_SAMPLE_REGS_USER
/// @param mask The regs_user_mask of the sample's layout
/// @param perf_reg PERF_REG_* index
/// @param value Output register value
/// @return false if the register was not sampled or the sample has no regs
inline bool ReadUserRegister(const SampleRecord& sample, uint64_t mask,
                             int perf_reg, uint64_t* value) noexcept {
  if (perf_reg < 0 || perf_reg >= 64 || sample.regs_data == nullptr ||
      (mask & (1ULL << perf_reg)) == 0) {
    return false;
  }
  const uint64_t below = mask & ((1ULL << perf_reg) - 1);
  const uint32_t index = static_cast<uint32_t>(__builtin_popcountll(below));
  if (index >= sample.regs_count) {
    return false;
  }
  *value = sample.reg_at(index);
  return true;
}

}  // namespace sampling
}  // namespace perfscope

#endif  // PERFSCOPE_SAMPLING_PERF_REGS_H_
