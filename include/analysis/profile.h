// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_ANALYSIS_PROFILE_H_
#define PERFSCOPE_ANALYSIS_PROFILE_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "analysis/call_frame.h"
#include "common/config.h"

namespace perfscope {
namespace analysis {

/// Name of the synthetic root of a call tree
constexpr const char* kRootFrameName = "[root]";

/// Name of the bucket that absorbs frames beyond the node cap
constexpr const char* kOtherFrameName = "[other]";

/// CallNode is one vertex of a call tree snapshot.
/// Invariant: inclusive == exclusive + sum of the children's inclusive.
struct CallNode {
  CallFrame frame;
  bool other = false;  // the [other] bucket of its parent
  double inclusive = 0.0;
  double exclusive = 0.0;
  uint64_t samples = 0;  // samples passing through this node
  std::vector<CallNode> children;  // sorted by inclusive, descending

  /// Display name: function, "unknown", "[root]" or "[other]"
  const std::string& name() const { return frame.name(); }

  /// First child with a display name, or nullptr
  const CallNode* find_child(const std::string& name) const;

  /// Number of nodes in this subtree, this one included
  size_t subtree_size() const;
};

/// One row of a flat profile
struct FlatEntry {
  CallFrame frame;
  bool other = false;
  double weight = 0.0;
  uint64_t samples = 0;

  const std::string& name() const { return frame.name(); }
};

/// Per-descriptor totals and multiplexing state
struct DescriptorStats {
  std::string name;
  double enabled_fraction = 1.0;
  double scale_factor = 1.0;
  double weight = 0.0;
  uint64_t samples = 0;
};

/// Counters carried in every snapshot
struct ProfileCounters {
  uint64_t samples = 0;
  double total_weight = 0.0;
  uint64_t lost_samples = 0;
  uint64_t malformed_records = 0;
  uint64_t corrupt_buffer_events = 0;
  uint64_t throttle_events = 0;
  uint64_t truncated_stacks = 0;
  uint64_t unresolved_frames = 0;
};

/// Profile is an immutable snapshot of the aggregated samples. Only the
/// structure of the configured mode is filled: the call tree in
/// kCallTree mode, the flat table in kFlat mode.
struct Profile {
  AggregationMode mode = AggregationMode::kCallTree;
  CallNode root;
  std::vector<FlatEntry> flat;  // sorted by weight, descending
  ProfileCounters counters;
  std::vector<DescriptorStats> descriptors;
  size_t node_count = 0;

  /// Flat row with a display name, or nullptr
  const FlatEntry* find_flat(const std::string& name) const;

  /// Sum of the flat weights
  double flat_weight() const;
};

}  // namespace analysis
}  // namespace perfscope

#endif  // PERFSCOPE_ANALYSIS_PROFILE_H_
