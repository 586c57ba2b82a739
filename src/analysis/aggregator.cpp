// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "analysis/aggregator.h"

#include <linux/perf_event.h>

#include <algorithm>
#include <utility>

namespace perfscope {
namespace analysis {

namespace {

CallFrame SyntheticFrame(const char* name) {
  return CallFrame(0, ResolvedSymbol{nullptr, 0, name});
}

bool HeavierNode(const CallNode& a, const CallNode& b) {
  if (a.inclusive != b.inclusive) return a.inclusive > b.inclusive;
  return a.name() < b.name();
}

bool HeavierEntry(const FlatEntry& a, const FlatEntry& b) {
  if (a.weight != b.weight) return a.weight > b.weight;
  return a.name() < b.name();
}

}  // namespace

FrameKey MakeFrameKey(const CallFrame& frame, FrameMergeMode mode) {
  FrameKey key;
  key.module = frame.module();
  if (mode == FrameMergeMode::kAddress) {
    key.address = frame.address;
    return key;
  }
  if (const auto* resolved = std::get_if<ResolvedSymbol>(&frame.symbol)) {
    key.name = resolved->name;
  } else {
    key.address = frame.address;
  }
  return key;
}

// ---------------------------------------------------------------------------
// CallTreeBuilder
// ---------------------------------------------------------------------------

CallTreeBuilder::CallTreeBuilder(FrameMergeMode mode, size_t max_nodes)
    : mode_(mode), max_nodes_(max_nodes), regular_nodes_(1) {
  nodes_.emplace_back();
  nodes_[0].frame = SyntheticFrame(kRootFrameName);
}

size_t CallTreeBuilder::other_of(size_t parent) {
  if (nodes_[parent].other_child == kNoNode) {
    nodes_.emplace_back();
    nodes_.back().frame = SyntheticFrame(kOtherFrameName);
    nodes_.back().other = true;
    nodes_[parent].other_child = nodes_.size() - 1;
  }
  return nodes_[parent].other_child;
}

void CallTreeBuilder::add_stack(const FrameList& frames, double weight) {
  nodes_[0].inclusive += weight;
  nodes_[0].samples++;

  size_t current = 0;
  for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
    FrameKey key = MakeFrameKey(*it, mode_);
    auto found = nodes_[current].children.find(key);
    size_t child;
    if (found != nodes_[current].children.end()) {
      child = found->second;
    } else if (regular_nodes_ >= max_nodes_) {
      // The rest of the stack is charged to the bucket
      size_t other = other_of(current);
      nodes_[other].inclusive += weight;
      nodes_[other].exclusive += weight;
      nodes_[other].samples++;
      return;
    } else {
      nodes_.emplace_back();
      nodes_.back().frame = *it;
      child = nodes_.size() - 1;
      nodes_[current].children.emplace(std::move(key), child);
      ++regular_nodes_;
    }
    nodes_[child].inclusive += weight;
    nodes_[child].samples++;
    current = child;
  }
  nodes_[current].exclusive += weight;
}

void CallTreeBuilder::merge(const CallTreeBuilder& other) {
  nodes_[0].inclusive += other.nodes_[0].inclusive;
  nodes_[0].exclusive += other.nodes_[0].exclusive;
  nodes_[0].samples += other.nodes_[0].samples;
  merge_node(other, 0, 0);
}

void CallTreeBuilder::merge_node(const CallTreeBuilder& other, size_t src,
                                 size_t dst) {
  for (const auto& entry : other.nodes_[src].children) {
    const Node& source = other.nodes_[entry.second];
    auto found = nodes_[dst].children.find(entry.first);
    size_t child;
    if (found != nodes_[dst].children.end()) {
      child = found->second;
    } else if (regular_nodes_ >= max_nodes_) {
      size_t bucket = other_of(dst);
      nodes_[bucket].inclusive += source.inclusive;
      nodes_[bucket].exclusive += source.inclusive;
      nodes_[bucket].samples += source.samples;
      continue;
    } else {
      nodes_.emplace_back();
      nodes_.back().frame = source.frame;
      child = nodes_.size() - 1;
      nodes_[dst].children.emplace(entry.first, child);
      ++regular_nodes_;
    }
    nodes_[child].inclusive += source.inclusive;
    nodes_[child].exclusive += source.exclusive;
    nodes_[child].samples += source.samples;
    merge_node(other, entry.second, child);
  }

  size_t source_other = other.nodes_[src].other_child;
  if (source_other != kNoNode) {
    const Node& source = other.nodes_[source_other];
    size_t bucket = other_of(dst);
    nodes_[bucket].inclusive += source.inclusive;
    nodes_[bucket].exclusive += source.exclusive;
    nodes_[bucket].samples += source.samples;
  }
}

CallNode CallTreeBuilder::build_node(size_t index) const {
  const Node& node = nodes_[index];
  CallNode result;
  result.frame = node.frame;
  result.other = node.other;
  result.inclusive = node.inclusive;
  result.exclusive = node.exclusive;
  result.samples = node.samples;
  result.children.reserve(node.children.size() + 1);
  for (const auto& entry : node.children) {
    result.children.push_back(build_node(entry.second));
  }
  if (node.other_child != kNoNode) {
    result.children.push_back(build_node(node.other_child));
  }
  std::sort(result.children.begin(), result.children.end(), HeavierNode);
  return result;
}

CallNode CallTreeBuilder::build() const { return build_node(0); }

// ---------------------------------------------------------------------------
// FlatTableBuilder
// ---------------------------------------------------------------------------

FlatTableBuilder::FlatTableBuilder(FrameMergeMode mode, size_t max_entries)
    : mode_(mode), max_entries_(max_entries), has_other_(false) {
  other_.frame = SyntheticFrame(kOtherFrameName);
  other_.other = true;
}

void FlatTableBuilder::add(const CallFrame& frame, double weight,
                           uint64_t samples) {
  FrameKey key = MakeFrameKey(frame, mode_);
  auto found = entries_.find(key);
  if (found == entries_.end()) {
    if (entries_.size() >= max_entries_) {
      has_other_ = true;
      other_.weight += weight;
      other_.samples += samples;
      return;
    }
    FlatEntry entry;
    entry.frame = frame;
    found = entries_.emplace(std::move(key), std::move(entry)).first;
  }
  found->second.weight += weight;
  found->second.samples += samples;
}

void FlatTableBuilder::merge(const FlatTableBuilder& other) {
  for (const auto& entry : other.entries_) {
    add(entry.second.frame, entry.second.weight, entry.second.samples);
  }
  if (other.has_other_) {
    has_other_ = true;
    other_.weight += other.other_.weight;
    other_.samples += other.other_.samples;
  }
}

std::vector<FlatEntry> FlatTableBuilder::build() const {
  std::vector<FlatEntry> rows;
  rows.reserve(size());
  for (const auto& entry : entries_) {
    rows.push_back(entry.second);
  }
  if (has_other_) {
    rows.push_back(other_);
  }
  std::sort(rows.begin(), rows.end(), HeavierEntry);
  return rows;
}

// ---------------------------------------------------------------------------
// AggregatorShard
// ---------------------------------------------------------------------------

AggregatorShard::AggregatorShard(const AggregatorOptions& options)
    : options_(options),
      tree_(options.frame_merge, options.max_nodes),
      flat_(options.frame_merge, options.max_nodes) {}

void AggregatorShard::ingest(const sampling::SampleRecord& sample,
                             size_t descriptor, uint64_t fixed_period,
                             const UnwindResult& unwound,
                             double scale_factor) {
  uint64_t period =
      sample.has(PERF_SAMPLE_PERIOD) ? sample.period : fixed_period;
  double weight = static_cast<double>(period) * scale_factor;

  std::lock_guard<std::mutex> lock(mutex_);
  counters_.samples++;
  counters_.total_weight += weight;
  counters_.unresolved_frames += unwound.unresolved;
  if (unwound.truncated) {
    counters_.truncated_stacks++;
  }
  if (descriptor >= descriptors_.size()) {
    descriptors_.resize(descriptor + 1);
  }
  descriptors_[descriptor].weight += weight;
  descriptors_[descriptor].samples++;

  if (options_.mode == AggregationMode::kCallTree) {
    tree_.add_stack(unwound.frames, weight);
    return;
  }

  if (unwound.frames.empty()) {
    flat_.add(CallFrame(), weight);
    return;
  }
  const CallFrame* charged = &unwound.frames.front();
  if (options_.flat_first_resolved) {
    for (const auto& frame : unwound.frames) {
      if (frame.resolved()) {
        charged = &frame;
        break;
      }
    }
  }
  flat_.add(*charged, weight);
}

void AggregatorShard::count_malformed(uint64_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.malformed_records += count;
}

void AggregatorShard::count_throttle(uint64_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.throttle_events += count;
}

void AggregatorShard::set_ring_counters(uint64_t lost_samples,
                                        uint64_t corrupt_events) {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.lost_samples = lost_samples;
  counters_.corrupt_buffer_events = corrupt_events;
}

// ---------------------------------------------------------------------------
// Aggregator
// ---------------------------------------------------------------------------

Aggregator::Aggregator(AggregatorOptions options)
    : options_(options), default_shard_(nullptr), descriptor_count_(0) {}

AggregatorShard* Aggregator::create_shard() {
  std::lock_guard<std::mutex> lock(mutex_);
  shards_.push_back(std::make_unique<AggregatorShard>(options_));
  return shards_.back().get();
}

void Aggregator::ingest(const sampling::SampleRecord& sample,
                        size_t descriptor, uint64_t fixed_period,
                        const UnwindResult& unwound, double scale_factor) {
  AggregatorShard* shard;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (default_shard_ == nullptr) {
      shards_.push_back(std::make_unique<AggregatorShard>(options_));
      default_shard_ = shards_.back().get();
    }
    shard = default_shard_;
  }
  shard->ingest(sample, descriptor, fixed_period, unwound, scale_factor);
}

void Aggregator::set_descriptor_source(size_t count, DescriptorSource source) {
  std::lock_guard<std::mutex> lock(mutex_);
  descriptor_count_ = count;
  descriptor_source_ = std::move(source);
}

std::shared_ptr<const Profile> Aggregator::snapshot() const {
  auto profile = std::make_shared<Profile>();
  profile->mode = options_.mode;

  CallTreeBuilder tree(options_.frame_merge, options_.max_nodes);
  FlatTableBuilder flat(options_.frame_merge, options_.max_nodes);
  std::vector<AggregatorShard::DescriptorTotals> totals;
  ProfileCounters& counters = profile->counters;

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> shard_lock(shard->mutex_);
    if (options_.mode == AggregationMode::kCallTree) {
      tree.merge(shard->tree_);
    } else {
      flat.merge(shard->flat_);
    }
    const ProfileCounters& c = shard->counters_;
    counters.samples += c.samples;
    counters.total_weight += c.total_weight;
    counters.lost_samples += c.lost_samples;
    counters.malformed_records += c.malformed_records;
    counters.corrupt_buffer_events += c.corrupt_buffer_events;
    counters.throttle_events += c.throttle_events;
    counters.truncated_stacks += c.truncated_stacks;
    counters.unresolved_frames += c.unresolved_frames;
    if (shard->descriptors_.size() > totals.size()) {
      totals.resize(shard->descriptors_.size());
    }
    for (size_t i = 0; i < shard->descriptors_.size(); ++i) {
      totals[i].weight += shard->descriptors_[i].weight;
      totals[i].samples += shard->descriptors_[i].samples;
    }
  }

  if (options_.mode == AggregationMode::kCallTree) {
    profile->root = tree.build();
    profile->node_count = tree.node_count();
  } else {
    profile->root.frame = SyntheticFrame(kRootFrameName);
    profile->root.inclusive = counters.total_weight;
    profile->root.samples = counters.samples;
    profile->flat = flat.build();
    profile->node_count = flat.size();
  }

  size_t count = std::max(descriptor_count_, totals.size());
  for (size_t i = 0; i < count; ++i) {
    DescriptorStats stats;
    if (descriptor_source_ && i < descriptor_count_) {
      stats = descriptor_source_(i);
    } else {
      stats.name = "#" + std::to_string(i);
    }
    if (i < totals.size()) {
      stats.weight = totals[i].weight;
      stats.samples = totals[i].samples;
    }
    profile->descriptors.push_back(std::move(stats));
  }
  return profile;
}

}  // namespace analysis
}  // namespace perfscope
