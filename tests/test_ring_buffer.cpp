// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include <gtest/gtest.h>

#include <cstring>
#include <memory>
#include <vector>

#include "sampling/ring_buffer.h"
#include "test_support.h"

using namespace perfscope::sampling;
using namespace perfscope::test;

class RingBufferTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto region = std::make_unique<HeapRegion>(1, kTestPageSize);
    region_ = region.get();
    buffer_ = std::make_unique<RingBuffer>(std::move(region), 0);
    writer_ = std::make_unique<SimulatedKernelWriter>(region_);
  }

  /// A record of total size `size` whose payload bytes count up from seed
  static std::vector<uint8_t> MakeRecord(size_t size, uint8_t seed) {
    RecordBuilder builder(PERF_RECORD_SAMPLE, PERF_RECORD_MISC_USER);
    for (size_t i = sizeof(perf_event_header); i < size; ++i) {
      uint8_t byte = static_cast<uint8_t>(seed + i);
      builder.put(&byte, 1);
    }
    return builder.finish();
  }

  std::vector<std::vector<uint8_t>> DrainAll() {
    std::vector<std::vector<uint8_t>> records;
    DrainBatch batch = buffer_->begin_drain();
    RawRecord record;
    while (batch.next(&record)) {
      records.emplace_back(record.bytes, record.bytes + record.size);
    }
    return records;
  }

  MappedRegion* region_ = nullptr;
  std::unique_ptr<RingBuffer> buffer_;
  std::unique_ptr<SimulatedKernelWriter> writer_;
};

TEST_F(RingBufferTest, EmptyBufferYieldsNothing) {
  EXPECT_FALSE(buffer_->has_data());
  EXPECT_TRUE(DrainAll().empty());
  EXPECT_EQ(buffer_->capacity(), kTestPageSize);
}

TEST_F(RingBufferTest, RecordsComeOutInOrderAndTailIsPublished) {
  std::vector<uint8_t> a = MakeRecord(24, 1);
  std::vector<uint8_t> b = MakeRecord(40, 2);
  writer_->write(a);
  writer_->write(b);
  writer_->publish();
  EXPECT_TRUE(buffer_->has_data());

  std::vector<std::vector<uint8_t>> records = DrainAll();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0], a);
  EXPECT_EQ(records[1], b);
  EXPECT_EQ(writer_->tail(), writer_->head());
  EXPECT_FALSE(buffer_->has_data());
  EXPECT_EQ(buffer_->records_drained(), 2u);
}

TEST_F(RingBufferTest, WrappedRecordIsReassembledByteExact) {
  // Leave 64 bytes before the end of the data region
  for (size_t i = 0; i < (kTestPageSize - 64) / 64; ++i) {
    writer_->write(MakeRecord(64, static_cast<uint8_t>(i)));
  }
  writer_->publish();
  EXPECT_EQ(DrainAll().size(), (kTestPageSize - 64) / 64);

  std::vector<uint8_t> wrapped = MakeRecord(200, 77);
  writer_->write_and_publish(wrapped);
  std::vector<std::vector<uint8_t>> records = DrainAll();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0], wrapped);

  EXPECT_EQ(writer_->tail(), writer_->head());
}

TEST_F(RingBufferTest, PartiallyPublishedRecordWaits) {
  std::vector<uint8_t> record = MakeRecord(64, 4);
  uint64_t start = writer_->head();
  writer_->write(record);

  writer_->publish_at(start + 4);
  EXPECT_TRUE(DrainAll().empty());
  writer_->publish_at(start + 32);
  EXPECT_TRUE(DrainAll().empty());
  EXPECT_EQ(writer_->tail(), start);

  writer_->publish();
  std::vector<std::vector<uint8_t>> records = DrainAll();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0], record);
}

TEST_F(RingBufferTest, LappedBufferCountsLostRecordsAndResumes) {
  for (int i = 0; i < 4; ++i) {
    writer_->write(MakeRecord(64, static_cast<uint8_t>(i)));
  }
  writer_->publish();
  ASSERT_EQ(DrainAll().size(), 4u);
  ASSERT_EQ(buffer_->mean_record_size(), 64u);

  // Two full laps without a drain
  for (size_t i = 0; i < 2 * kTestPageSize / 64; ++i) {
    writer_->write(MakeRecord(64, static_cast<uint8_t>(i)));
  }
  writer_->publish();
  EXPECT_TRUE(DrainAll().empty());
  EXPECT_EQ(buffer_->lost_samples(), 2 * kTestPageSize / 64);
  EXPECT_EQ(writer_->tail(), writer_->head());

  std::vector<uint8_t> next = MakeRecord(48, 42);
  writer_->write_and_publish(next);
  std::vector<std::vector<uint8_t>> records = DrainAll();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0], next);
}

TEST_F(RingBufferTest, LapBeforeFirstDrainUsesSizeHint) {
  buffer_->set_record_size_hint(48);
  EXPECT_EQ(buffer_->mean_record_size(), 48u);

  for (size_t i = 0; i < 2 * kTestPageSize / 48; ++i) {
    writer_->write(MakeRecord(48, static_cast<uint8_t>(i)));
  }
  writer_->publish();
  EXPECT_TRUE(DrainAll().empty());
  EXPECT_EQ(buffer_->lost_samples(), writer_->head() / 48);
}

TEST_F(RingBufferTest, SizeHintIsAtLeastOneWord) {
  buffer_->set_record_size_hint(0);
  EXPECT_EQ(buffer_->mean_record_size(), sizeof(uint64_t));
}

TEST_F(RingBufferTest, CorruptHeaderSkipsToHead) {
  RecordBuilder bad(PERF_RECORD_SAMPLE, 0);
  bad.u64(0);
  std::vector<uint8_t> bytes = bad.finish();
  perf_event_header header;
  std::memcpy(&header, bytes.data(), sizeof(header));
  header.size = 12;
  std::memcpy(bytes.data(), &header, sizeof(header));
  writer_->write(bytes);
  writer_->write(MakeRecord(32, 1));
  writer_->publish();

  EXPECT_TRUE(DrainAll().empty());
  EXPECT_EQ(buffer_->corrupt_events(), 1u);
  EXPECT_EQ(writer_->tail(), writer_->head());

  std::vector<uint8_t> good = MakeRecord(32, 2);
  writer_->write_and_publish(good);
  std::vector<std::vector<uint8_t>> records = DrainAll();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0], good);
}

TEST_F(RingBufferTest, LostRecordsAreAdded) {
  buffer_->add_lost(17);
  buffer_->add_lost(3);
  EXPECT_EQ(buffer_->lost_samples(), 20u);
}

TEST_F(RingBufferTest, ReaderReportsBuffersWithData) {
  auto other_region = std::make_unique<HeapRegion>(1, kTestPageSize);
  MappedRegion* other_memory = other_region.get();
  RingBuffer other(std::move(other_region), 1);
  RingBufferReader reader({buffer_.get(), &other});

  EXPECT_TRUE(reader.poll(0).empty());
  SimulatedKernelWriter(other_memory).write_and_publish(MakeRecord(16, 0));
  std::vector<size_t> ready = reader.poll(0);
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_EQ(ready[0], 1u);
  EXPECT_EQ(reader.buffer(ready[0])->cpu(), 1);
}
