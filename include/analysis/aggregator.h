// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_ANALYSIS_AGGREGATOR_H_
#define PERFSCOPE_ANALYSIS_AGGREGATOR_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "analysis/profile.h"
#include "analysis/stack_unwinder.h"
#include "common/config.h"
#include "sampling/sample_record.h"

namespace perfscope {
namespace analysis {

/// Options of the aggregator
struct AggregatorOptions {
  AggregationMode mode = AggregationMode::kCallTree;
  FrameMergeMode frame_merge = FrameMergeMode::kFunction;

  /// Flat mode charges the first resolved frame instead of the leaf
  bool flat_first_resolved = false;

  /// Node cap per shard and for the merged profile (flat rows in flat mode)
  size_t max_nodes = kDefaultMaxNodes;
};

/// Identity of a frame under a merge mode
struct FrameKey {
  uint64_t address = 0;
  std::string module;
  std::string name;

  bool operator==(const FrameKey& other) const {
    return address == other.address && module == other.module &&
           name == other.name;
  }
};

struct FrameKeyHash {
  size_t operator()(const FrameKey& key) const noexcept {
    size_t h1 = std::hash<std::string>{}(key.module);
    size_t h2 = std::hash<std::string>{}(key.name);
    size_t h3 = std::hash<uint64_t>{}(key.address);
    return h1 ^ (h2 << 1) ^ (h3 << 2);
  }
};

/// Build the identity of a frame.
/// kFunction: resolved frames merge by (module, symbol), unresolved ones by
/// (module, address). kAddress: every address is distinct.
FrameKey MakeFrameKey(const CallFrame& frame, FrameMergeMode mode);

/// CallTreeBuilder accumulates weighted stacks into a capped call tree.
/// Not thread-safe.
class CallTreeBuilder {
 public:
  CallTreeBuilder(FrameMergeMode mode, size_t max_nodes);

  /// Add one stack (innermost first) with its weight
  void add_stack(const FrameList& frames, double weight);

  /// Merge another tree, applying this tree's cap
  void merge(const CallTreeBuilder& other);

  /// Immutable copy, children sorted by inclusive weight
  CallNode build() const;

  /// Nodes, root and [other] buckets included
  size_t node_count() const { return nodes_.size(); }

 private:
  static constexpr size_t kNoNode = static_cast<size_t>(-1);

  struct Node {
    CallFrame frame;
    bool other = false;
    double inclusive = 0.0;
    double exclusive = 0.0;
    uint64_t samples = 0;
    std::unordered_map<FrameKey, size_t, FrameKeyHash> children;
    size_t other_child = kNoNode;
  };

  size_t other_of(size_t parent);
  void merge_node(const CallTreeBuilder& other, size_t src, size_t dst);
  CallNode build_node(size_t index) const;

  FrameMergeMode mode_;
  size_t max_nodes_;
  size_t regular_nodes_;
  std::vector<Node> nodes_;  // nodes_[0] is the root
};

/// FlatTableBuilder accumulates weight per frame, capped like the tree
class FlatTableBuilder {
 public:
  FlatTableBuilder(FrameMergeMode mode, size_t max_entries);

  void add(const CallFrame& frame, double weight, uint64_t samples = 1);
  void merge(const FlatTableBuilder& other);

  /// Rows sorted by weight
  std::vector<FlatEntry> build() const;

  size_t size() const { return entries_.size() + (has_other_ ? 1 : 0); }

 private:
  FrameMergeMode mode_;
  size_t max_entries_;
  std::unordered_map<FrameKey, FlatEntry, FrameKeyHash> entries_;
  FlatEntry other_;
  bool has_other_;
};

/// AggregatorShard is the part of the aggregator owned by one drain task.
/// Its mutex is only contended by snapshots.
class AggregatorShard {
 public:
  explicit AggregatorShard(const AggregatorOptions& options);

  AggregatorShard(const AggregatorShard&) = delete;
  AggregatorShard& operator=(const AggregatorShard&) = delete;

  /// Add one sample.
  /// weight = (PERIOD if sampled, else fixed_period) x scale_factor
  void ingest(const sampling::SampleRecord& sample, size_t descriptor,
              uint64_t fixed_period, const UnwindResult& unwound,
              double scale_factor);

  void count_malformed(uint64_t count = 1);
  void count_throttle(uint64_t count = 1);

  /// Publish the ring buffer totals of the task
  void set_ring_counters(uint64_t lost_samples, uint64_t corrupt_events);

 private:
  friend class Aggregator;

  struct DescriptorTotals {
    double weight = 0.0;
    uint64_t samples = 0;
  };

  const AggregatorOptions options_;
  mutable std::mutex mutex_;
  CallTreeBuilder tree_;
  FlatTableBuilder flat_;
  ProfileCounters counters_;
  std::vector<DescriptorTotals> descriptors_;
};

/// Aggregator merges the samples of every drain task into profiles.
///
/// Each task ingests into its own shard. snapshot() locks one shard at a
/// time and merges it into a new immutable profile, so no update is lost
/// and a snapshot is at most one merge behind.
class Aggregator {
 public:
  /// Name, enabled fraction and scale factor of a descriptor
  using DescriptorSource = std::function<DescriptorStats(size_t descriptor)>;

  explicit Aggregator(AggregatorOptions options = AggregatorOptions());

  Aggregator(const Aggregator&) = delete;
  Aggregator& operator=(const Aggregator&) = delete;

  /// New shard owned by the aggregator
  AggregatorShard* create_shard();

  /// Ingest through the aggregator's own shard
  void ingest(const sampling::SampleRecord& sample, size_t descriptor,
              uint64_t fixed_period, const UnwindResult& unwound,
              double scale_factor);

  /// Describe count descriptors in snapshots
  void set_descriptor_source(size_t count, DescriptorSource source);

  /// Merge every shard into a new profile
  std::shared_ptr<const Profile> snapshot() const;

  const AggregatorOptions& options() const { return options_; }

 private:
  const AggregatorOptions options_;

  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<AggregatorShard>> shards_;
  AggregatorShard* default_shard_;
  size_t descriptor_count_;
  DescriptorSource descriptor_source_;
};

}  // namespace analysis
}  // namespace perfscope

#endif  // PERFSCOPE_ANALYSIS_AGGREGATOR_H_
