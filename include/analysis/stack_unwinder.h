// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_ANALYSIS_STACK_UNWINDER_H_
#define PERFSCOPE_ANALYSIS_STACK_UNWINDER_H_

#include <cstddef>
#include <cstdint>
#include <memory>

#include "analysis/call_frame.h"
#include "analysis/call_stack.h"
#include "analysis/process_maps.h"
#include "analysis/symbol_resolver.h"
#include "common/config.h"
#include "sampling/sample_record.h"

namespace perfscope {
namespace analysis {

/// Frames of one sample
struct UnwindResult {
  FrameList frames;    // innermost first
  bool truncated = false;
  size_t unresolved = 0;

  void clear() {
    frames.clear();
    truncated = false;
    unresolved = 0;
  }
};

/// StackUnwinder turns a sample into symbolized frames. Subclasses collect
/// the raw addresses; symbolization is shared.
///
/// One instance belongs to one drain task. The address space cache and the
/// resolver are shared between tasks.
class StackUnwinder {
 public:
  StackUnwinder(AddressSpaceCache* spaces, const SymbolResolver* resolver,
                size_t max_depth);
  virtual ~StackUnwinder() = default;

  StackUnwinder(const StackUnwinder&) = delete;
  StackUnwinder& operator=(const StackUnwinder&) = delete;

  /// Unwind and symbolize one sample
  /// @param sample Decoded sample
  /// @param layout Layout the sample was decoded with
  /// @param pid Process whose address space the user addresses belong to,
  ///            0 for the idle task (no mapping lookups)
  /// @param result Output frames, cleared first
  void unwind(const sampling::SampleRecord& sample,
              const sampling::SampleLayout& layout, int pid,
              UnwindResult* result);

  size_t max_depth() const { return stack_.limit(); }

  /// Create the unwinder for a mode
  static std::unique_ptr<StackUnwinder> Create(UnwindMode mode,
                                               AddressSpaceCache* spaces,
                                               const SymbolResolver* resolver,
                                               size_t max_depth);

 protected:
  /// Fill stack with the sample's return addresses
  /// @return true if the stack is truncated
  virtual bool collect(const sampling::SampleRecord& sample,
                       const sampling::SampleLayout& layout, int pid,
                       CallStack<>* stack) = 0;

  /// Copy the kernel callchain, skipping PERF_CONTEXT_* markers
  bool collect_callchain(const sampling::SampleRecord& sample,
                         CallStack<>* stack) const;

  /// Only the sampled instruction pointer
  void collect_ip(const sampling::SampleRecord& sample,
                  CallStack<>* stack) const;

  AddressSpaceCache* spaces_;
  const SymbolResolver* resolver_;

 private:
  CallStack<> stack_;
};

/// FramePointerUnwinder uses the kernel callchain when the sample has one.
/// Otherwise it follows the saved frame pointers through the copied user
/// stack.
class FramePointerUnwinder : public StackUnwinder {
 public:
  FramePointerUnwinder(AddressSpaceCache* spaces,
                       const SymbolResolver* resolver, size_t max_depth);

 protected:
  bool collect(const sampling::SampleRecord& sample,
               const sampling::SampleLayout& layout, int pid,
               CallStack<>* stack) override;

 private:
  bool walk_frame_pointers(const sampling::SampleRecord& sample,
                           const sampling::SampleLayout& layout, int pid,
                           CallStack<>* stack);
};

/// DwarfUnwinder unwinds the copied user stack with libunwind, using the
/// CFI of the mapped ELF files (.eh_frame_hdr binary search table).
class DwarfUnwinder : public StackUnwinder {
 public:
  DwarfUnwinder(AddressSpaceCache* spaces, const SymbolResolver* resolver,
                size_t max_depth);
  ~DwarfUnwinder() override;

 protected:
  bool collect(const sampling::SampleRecord& sample,
               const sampling::SampleLayout& layout, int pid,
               CallStack<>* stack) override;

 private:
  struct AddressSpace;
  std::unique_ptr<AddressSpace> space_;
};

}  // namespace analysis
}  // namespace perfscope

#endif  // PERFSCOPE_ANALYSIS_STACK_UNWINDER_H_
