// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_ANALYSIS_CALL_STACK_H_
#define PERFSCOPE_ANALYSIS_CALL_STACK_H_

#include <cstddef>
#include <cstdint>

namespace perfscope {
namespace analysis {

/// Hard upper bound on frames kept per sample
constexpr size_t kMaxUnwindDepth = 1024;

/// CallStack is the fixed-capacity scratch an unwinder fills with the
/// addresses of one sample, innermost first. It never allocates, so one
/// instance is reused for every sample of a drain task.
///
/// The runtime limit (at most MaxDepth) is the configured maximum depth.
template <size_t MaxDepth = kMaxUnwindDepth>
class CallStack {
 public:
  using AddressType = uint64_t;

  explicit CallStack(size_t limit = MaxDepth) noexcept
      : depth_(0), limit_(limit == 0 || limit > MaxDepth ? MaxDepth : limit) {}

  CallStack(const CallStack&) = delete;
  CallStack& operator=(const CallStack&) = delete;

  size_t depth() const noexcept { return depth_; }
  size_t limit() const noexcept { return limit_; }
  static constexpr size_t max_depth() noexcept { return MaxDepth; }

  bool empty() const noexcept { return depth_ == 0; }
  bool full() const noexcept { return depth_ >= limit_; }

  /// @param index 0 is the innermost frame
  AddressType frame(size_t index) const noexcept {
    return index < depth_ ? frames_[index] : 0;
  }

  const AddressType* frames() const noexcept { return frames_; }

  /// @return false when the limit is reached
  bool push(AddressType address) noexcept {
    if (depth_ >= limit_) {
      return false;
    }
    frames_[depth_++] = address;
    return true;
  }

  void clear() noexcept { depth_ = 0; }

 private:
  size_t depth_;
  size_t limit_;
  AddressType frames_[MaxDepth];
};

}  // namespace analysis
}  // namespace perfscope

#endif  // PERFSCOPE_ANALYSIS_CALL_STACK_H_
