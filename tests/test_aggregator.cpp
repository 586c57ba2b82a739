// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include <gtest/gtest.h>

#include <linux/perf_event.h>

#include <atomic>
#include <cmath>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "analysis/aggregator.h"

using namespace perfscope;
using namespace perfscope::analysis;
using namespace perfscope::sampling;

namespace {

const auto kModule = std::make_shared<const std::string>("/usr/bin/app");

CallFrame Fn(const std::string& name, uint64_t address = 0x1000) {
  return CallFrame(address, ResolvedSymbol{kModule, 0, name});
}

CallFrame Unknown(uint64_t address) {
  return CallFrame(address, UnresolvedSymbol{address, kModule, address});
}

/// Stack given outermost first, stored innermost first
UnwindResult Stack(std::vector<CallFrame> outer_to_inner) {
  UnwindResult result;
  result.frames.assign(outer_to_inner.rbegin(), outer_to_inner.rend());
  for (const auto& frame : result.frames) {
    if (!frame.resolved()) ++result.unresolved;
  }
  return result;
}

SampleRecord WithPeriod(uint64_t period) {
  SampleRecord sample;
  sample.present = PERF_SAMPLE_IP | PERF_SAMPLE_PERIOD;
  sample.period = period;
  return sample;
}

void ExpectTreeConsistent(const CallNode& node) {
  double children = 0.0;
  for (const auto& child : node.children) {
    children += child.inclusive;
    ExpectTreeConsistent(child);
  }
  EXPECT_NEAR(node.inclusive, node.exclusive + children, 1e-6)
      << "at " << node.name();
}

}  // namespace

class AggregatorTest : public ::testing::Test {
 protected:
  AggregatorOptions TreeOptions(size_t max_nodes = kDefaultMaxNodes) {
    AggregatorOptions options;
    options.mode = AggregationMode::kCallTree;
    options.max_nodes = max_nodes;
    return options;
  }

  AggregatorOptions FlatOptions(size_t max_nodes = kDefaultMaxNodes) {
    AggregatorOptions options;
    options.mode = AggregationMode::kFlat;
    options.max_nodes = max_nodes;
    return options;
  }
};

TEST_F(AggregatorTest, CallTreeWeights) {
  Aggregator aggregator(TreeOptions());
  aggregator.ingest(WithPeriod(100), 0, 1,
                    Stack({Fn("main"), Fn("compute"), Fn("kernel")}), 1.0);
  aggregator.ingest(WithPeriod(100), 0, 1,
                    Stack({Fn("main"), Fn("compute")}), 1.0);
  aggregator.ingest(WithPeriod(50), 0, 1, Stack({Fn("main"), Fn("io")}), 1.0);

  auto profile = aggregator.snapshot();
  EXPECT_EQ(profile->mode, AggregationMode::kCallTree);
  EXPECT_EQ(profile->root.name(), kRootFrameName);
  EXPECT_DOUBLE_EQ(profile->root.inclusive, 250.0);
  EXPECT_EQ(profile->root.samples, 3u);

  const CallNode* main_node = profile->root.find_child("main");
  ASSERT_NE(main_node, nullptr);
  EXPECT_DOUBLE_EQ(main_node->inclusive, 250.0);
  EXPECT_DOUBLE_EQ(main_node->exclusive, 0.0);
  ASSERT_EQ(main_node->children.size(), 2u);
  // Heaviest first
  EXPECT_EQ(main_node->children[0].name(), "compute");
  EXPECT_DOUBLE_EQ(main_node->children[0].inclusive, 200.0);
  EXPECT_DOUBLE_EQ(main_node->children[0].exclusive, 100.0);
  EXPECT_EQ(main_node->children[1].name(), "io");

  EXPECT_EQ(profile->node_count, 5u);
  EXPECT_EQ(profile->root.subtree_size(), 5u);
  ExpectTreeConsistent(profile->root);
}

TEST_F(AggregatorTest, WeightUsesFixedPeriodAndScale) {
  Aggregator aggregator(TreeOptions());
  SampleRecord no_period;
  no_period.present = PERF_SAMPLE_IP;
  aggregator.ingest(no_period, 0, 1000, Stack({Fn("main")}), 1.0);
  aggregator.ingest(WithPeriod(10), 1, 1000, Stack({Fn("main")}), 2.5);

  auto profile = aggregator.snapshot();
  EXPECT_DOUBLE_EQ(profile->counters.total_weight, 1025.0);
  ASSERT_EQ(profile->descriptors.size(), 2u);
  EXPECT_DOUBLE_EQ(profile->descriptors[0].weight, 1000.0);
  EXPECT_DOUBLE_EQ(profile->descriptors[1].weight, 25.0);
  EXPECT_EQ(profile->descriptors[1].name, "#1");
}

TEST_F(AggregatorTest, EmptyStackChargesRoot) {
  Aggregator aggregator(TreeOptions());
  aggregator.ingest(WithPeriod(7), 0, 1, UnwindResult(), 1.0);
  auto profile = aggregator.snapshot();
  EXPECT_DOUBLE_EQ(profile->root.inclusive, 7.0);
  EXPECT_DOUBLE_EQ(profile->root.exclusive, 7.0);
  EXPECT_TRUE(profile->root.children.empty());
}

TEST_F(AggregatorTest, FunctionMergeKeepsUnresolvedAddressesApart) {
  Aggregator aggregator(TreeOptions());
  aggregator.ingest(WithPeriod(1), 0, 1,
                    Stack({Fn("main", 0x1000), Fn("work", 0x2000)}), 1.0);
  aggregator.ingest(WithPeriod(1), 0, 1,
                    Stack({Fn("main", 0x1010), Fn("work", 0x2040)}), 1.0);
  aggregator.ingest(WithPeriod(1), 0, 1,
                    Stack({Fn("main", 0x1000), Unknown(0x9000)}), 1.0);
  aggregator.ingest(WithPeriod(1), 0, 1,
                    Stack({Fn("main", 0x1000), Unknown(0x9100)}), 1.0);

  auto profile = aggregator.snapshot();
  const CallNode* main_node = profile->root.find_child("main");
  ASSERT_NE(main_node, nullptr);
  EXPECT_DOUBLE_EQ(main_node->inclusive, 4.0);
  // work merged, the two unknown addresses kept apart
  EXPECT_EQ(main_node->children.size(), 3u);
  EXPECT_DOUBLE_EQ(main_node->find_child("work")->inclusive, 2.0);
}

TEST_F(AggregatorTest, AddressMergeKeepsEveryAddress) {
  AggregatorOptions options = TreeOptions();
  options.frame_merge = FrameMergeMode::kAddress;
  Aggregator aggregator(options);
  aggregator.ingest(WithPeriod(1), 0, 1, Stack({Fn("main", 0x1000)}), 1.0);
  aggregator.ingest(WithPeriod(1), 0, 1, Stack({Fn("main", 0x1010)}), 1.0);
  aggregator.ingest(WithPeriod(1), 0, 1, Stack({Fn("main", 0x1000)}), 1.0);
  auto profile = aggregator.snapshot();
  EXPECT_EQ(profile->root.children.size(), 2u);
}

TEST_F(AggregatorTest, NodeCapChargesOtherBucket) {
  // Root plus three regular nodes
  Aggregator aggregator(TreeOptions(4));
  aggregator.ingest(WithPeriod(10), 0, 1,
                    Stack({Fn("main"), Fn("a"), Fn("b")}), 1.0);
  aggregator.ingest(WithPeriod(5), 0, 1,
                    Stack({Fn("main"), Fn("c"), Fn("d")}), 1.0);
  aggregator.ingest(WithPeriod(3), 0, 1, Stack({Fn("other_root")}), 1.0);
  aggregator.ingest(WithPeriod(2), 0, 1, Stack({Fn("main"), Fn("a")}), 1.0);

  auto profile = aggregator.snapshot();
  EXPECT_DOUBLE_EQ(profile->root.inclusive, 20.0);
  ExpectTreeConsistent(profile->root);

  const CallNode* main_node = profile->root.find_child("main");
  ASSERT_NE(main_node, nullptr);
  const CallNode* main_other = main_node->find_child(kOtherFrameName);
  ASSERT_NE(main_other, nullptr);
  EXPECT_TRUE(main_other->other);
  EXPECT_DOUBLE_EQ(main_other->inclusive, 5.0);
  EXPECT_DOUBLE_EQ(main_other->exclusive, 5.0);

  const CallNode* root_other = profile->root.find_child(kOtherFrameName);
  ASSERT_NE(root_other, nullptr);
  EXPECT_DOUBLE_EQ(root_other->inclusive, 3.0);

  // Existing nodes still take weight once the cap is reached
  EXPECT_DOUBLE_EQ(main_node->find_child("a")->exclusive, 2.0);
  EXPECT_EQ(profile->node_count, 6u);
}

TEST_F(AggregatorTest, MergedShardsRespectCap) {
  Aggregator aggregator(TreeOptions(3));
  AggregatorShard* first = aggregator.create_shard();
  AggregatorShard* second = aggregator.create_shard();
  first->ingest(WithPeriod(4), 0, 1, Stack({Fn("main"), Fn("a")}), 1.0);
  second->ingest(WithPeriod(6), 0, 1, Stack({Fn("main"), Fn("b")}), 1.0);

  auto profile = aggregator.snapshot();
  EXPECT_DOUBLE_EQ(profile->root.inclusive, 10.0);
  EXPECT_LE(profile->root.subtree_size(), 3u + 2u);
  ExpectTreeConsistent(profile->root);
  const CallNode* main_node = profile->root.find_child("main");
  ASSERT_NE(main_node, nullptr);
  EXPECT_DOUBLE_EQ(main_node->inclusive, 10.0);
}

TEST_F(AggregatorTest, FlatProfileConservesWeight) {
  Aggregator aggregator(FlatOptions(3));
  aggregator.ingest(WithPeriod(10), 0, 1, Stack({Fn("main"), Fn("a")}), 1.0);
  aggregator.ingest(WithPeriod(20), 0, 1, Stack({Fn("main"), Fn("b")}), 1.0);
  aggregator.ingest(WithPeriod(5), 0, 1, Stack({Fn("main"), Fn("a")}), 1.0);
  aggregator.ingest(WithPeriod(1), 0, 1, Stack({Fn("c")}), 1.0);
  aggregator.ingest(WithPeriod(2), 0, 1, Stack({Fn("d")}), 1.0);
  aggregator.ingest(WithPeriod(4), 0, 1, UnwindResult(), 1.0);

  auto profile = aggregator.snapshot();
  EXPECT_EQ(profile->mode, AggregationMode::kFlat);
  EXPECT_DOUBLE_EQ(profile->flat_weight(), 42.0);
  EXPECT_DOUBLE_EQ(profile->root.inclusive, 42.0);
  EXPECT_EQ(profile->counters.samples, 6u);

  // Leaves are charged
  EXPECT_EQ(profile->find_flat("main"), nullptr);
  ASSERT_NE(profile->find_flat("b"), nullptr);
  EXPECT_EQ(profile->flat[0].name(), "b");
  EXPECT_DOUBLE_EQ(profile->find_flat("a")->weight, 15.0);
  EXPECT_EQ(profile->find_flat("a")->samples, 2u);
  const FlatEntry* other = profile->find_flat(kOtherFrameName);
  ASSERT_NE(other, nullptr);
  EXPECT_TRUE(other->other);
  EXPECT_DOUBLE_EQ(other->weight, 6.0);
  EXPECT_EQ(profile->node_count, 4u);
}

TEST_F(AggregatorTest, FlatFirstResolvedFrame) {
  AggregatorOptions options = FlatOptions();
  options.flat_first_resolved = true;
  Aggregator aggregator(options);
  aggregator.ingest(WithPeriod(3), 0, 1,
                    Stack({Fn("main"), Fn("caller"), Unknown(0x9000)}), 1.0);
  aggregator.ingest(WithPeriod(1), 0, 1, Stack({Unknown(0x9000)}), 1.0);

  auto profile = aggregator.snapshot();
  ASSERT_NE(profile->find_flat("caller"), nullptr);
  EXPECT_DOUBLE_EQ(profile->find_flat("caller")->weight, 3.0);
  ASSERT_NE(profile->find_flat(kUnknownSymbol), nullptr);
  EXPECT_DOUBLE_EQ(profile->find_flat(kUnknownSymbol)->weight, 1.0);
  EXPECT_EQ(profile->counters.unresolved_frames, 2u);
}

TEST_F(AggregatorTest, CountersAndDescriptorSource) {
  Aggregator aggregator(TreeOptions());
  aggregator.set_descriptor_source(2, [](size_t i) {
    DescriptorStats stats;
    stats.name = i == 0 ? "cycles" : "instructions";
    stats.enabled_fraction = 0.5;
    stats.scale_factor = 2.0;
    return stats;
  });
  AggregatorShard* shard = aggregator.create_shard();
  UnwindResult truncated = Stack({Fn("main")});
  truncated.truncated = true;
  shard->ingest(WithPeriod(1), 0, 1, truncated, 2.0);
  shard->count_malformed();
  shard->count_throttle(2);
  shard->set_ring_counters(11, 1);
  shard->set_ring_counters(12, 1);

  auto profile = aggregator.snapshot();
  EXPECT_EQ(profile->counters.truncated_stacks, 1u);
  EXPECT_EQ(profile->counters.malformed_records, 1u);
  EXPECT_EQ(profile->counters.throttle_events, 2u);
  EXPECT_EQ(profile->counters.lost_samples, 12u);
  EXPECT_EQ(profile->counters.corrupt_buffer_events, 1u);
  ASSERT_EQ(profile->descriptors.size(), 2u);
  EXPECT_EQ(profile->descriptors[0].name, "cycles");
  EXPECT_DOUBLE_EQ(profile->descriptors[0].weight, 2.0);
  EXPECT_EQ(profile->descriptors[1].samples, 0u);
  EXPECT_DOUBLE_EQ(profile->descriptors[1].enabled_fraction, 0.5);
}

TEST_F(AggregatorTest, SnapshotsAreImmutable) {
  Aggregator aggregator(TreeOptions());
  aggregator.ingest(WithPeriod(1), 0, 1, Stack({Fn("main")}), 1.0);
  auto before = aggregator.snapshot();
  aggregator.ingest(WithPeriod(1), 0, 1, Stack({Fn("main")}), 1.0);
  auto after = aggregator.snapshot();
  EXPECT_DOUBLE_EQ(before->root.inclusive, 1.0);
  EXPECT_DOUBLE_EQ(after->root.inclusive, 2.0);
}

TEST_F(AggregatorTest, ConcurrentIngestAndSnapshot) {
  constexpr int kThreads = 4;
  constexpr int kSamplesPerThread = 5000;
  Aggregator aggregator(TreeOptions());
  std::vector<AggregatorShard*> shards;
  for (int i = 0; i < kThreads; ++i) {
    shards.push_back(aggregator.create_shard());
  }

  std::atomic<bool> done(false);
  std::thread reader([&]() {
    uint64_t last = 0;
    while (!done.load()) {
      auto profile = aggregator.snapshot();
      EXPECT_GE(profile->counters.samples, last);
      EXPECT_DOUBLE_EQ(profile->root.inclusive,
                       static_cast<double>(profile->counters.samples));
      last = profile->counters.samples;
    }
  });

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t]() {
      UnwindResult stacks[] = {Stack({Fn("main"), Fn("a")}),
                               Stack({Fn("main"), Fn("b"), Fn("c")}),
                               Stack({Fn("worker" + std::to_string(t))})};
      for (int i = 0; i < kSamplesPerThread; ++i) {
        shards[t]->ingest(WithPeriod(1), 0, 1, stacks[i % 3], 1.0);
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  done.store(true);
  reader.join();

  auto profile = aggregator.snapshot();
  EXPECT_EQ(profile->counters.samples,
            static_cast<uint64_t>(kThreads * kSamplesPerThread));
  EXPECT_DOUBLE_EQ(profile->root.inclusive, kThreads * kSamplesPerThread);
  ExpectTreeConsistent(profile->root);
  EXPECT_NE(profile->root.find_child("worker3"), nullptr);
}
