// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_SAMPLING_RING_BUFFER_H_
#define PERFSCOPE_SAMPLING_RING_BUFFER_H_

#include <linux/perf_event.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "sampling/perf_backend.h"

namespace perfscope {
namespace sampling {

/// A record as it sits in the ring buffer, header included.
/// The bytes are valid until the next call to DrainBatch::next().
struct RawRecord {
  const uint8_t* bytes = nullptr;
  uint32_t size = 0;
  uint32_t type = 0;
  uint16_t misc = 0;
};

class DrainBatch;

/// RingBuffer is the reader side of one kernel ring buffer.
///
/// The kernel advances data_head and writes records; the reader only ever
/// advances data_tail. Records that wrap around the end of the data region
/// are reassembled in a scratch buffer allocated once at construction.
class RingBuffer {
 public:
  /// @param region Mapped control page + data region (power-of-two size)
  /// @param cpu Cpu the buffer belongs to
  RingBuffer(std::unique_ptr<MappedRegion> region, int cpu);

  RingBuffer(const RingBuffer&) = delete;
  RingBuffer& operator=(const RingBuffer&) = delete;

  /// Start a bounded drain of everything written so far
  DrainBatch begin_drain();

  /// True when the kernel has written past the reader position
  bool has_data() const;

  int cpu() const { return cpu_; }
  int poll_fd() const { return region_->poll_fd(); }
  size_t capacity() const { return capacity_; }

  /// Samples lost to laps plus PERF_RECORD_LOST totals
  uint64_t lost_samples() const {
    return lost_samples_.load(std::memory_order_relaxed);
  }

  /// Corrupt header events (size 0 or not a multiple of 8)
  uint64_t corrupt_events() const {
    return corrupt_events_.load(std::memory_order_relaxed);
  }

  uint64_t records_drained() const {
    return records_.load(std::memory_order_relaxed);
  }

  /// Add the lost field of a PERF_RECORD_LOST
  void add_lost(uint64_t lost) {
    lost_samples_.fetch_add(lost, std::memory_order_relaxed);
  }

  /// Mean size of the drained records, the size hint before any record
  /// was seen
  uint64_t mean_record_size() const;

  /// Expected record size used until records have been drained (default 8)
  void set_record_size_hint(uint64_t bytes) {
    size_hint_ = bytes < sizeof(uint64_t) ? sizeof(uint64_t) : bytes;
  }

 private:
  friend class DrainBatch;

  uint64_t load_head() const;
  void store_tail(uint64_t tail);
  void copy_out(uint64_t pos, size_t len, uint8_t* dst) const;

  std::unique_ptr<MappedRegion> region_;
  perf_event_mmap_page* header_;
  uint8_t* data_;
  size_t capacity_;
  uint64_t mask_;
  int cpu_;

  // 8-byte aligned reassembly area for wrapped records
  std::vector<uint64_t> scratch_;

  // Reader position, only touched by the draining thread
  uint64_t tail_;
  uint64_t drained_bytes_;
  uint64_t size_hint_;

  std::atomic<uint64_t> records_;
  std::atomic<uint64_t> lost_samples_;
  std::atomic<uint64_t> corrupt_events_;
};

/// DrainBatch yields the records between the reader position and the
/// data_head observed when the batch began. Truncated trailing data stays
/// for the next batch. data_tail is published when the batch ends.
class DrainBatch {
 public:
  ~DrainBatch() { end(); }

  DrainBatch(DrainBatch&& other) noexcept;
  DrainBatch(const DrainBatch&) = delete;
  DrainBatch& operator=(const DrainBatch&) = delete;
  DrainBatch& operator=(DrainBatch&&) = delete;

  /// Fetch the next complete record
  /// @return false when the batch is exhausted
  bool next(RawRecord* record);

  /// Publish the reader position. Idempotent.
  void end();

 private:
  friend class RingBuffer;
  DrainBatch(RingBuffer* buffer, uint64_t head, uint64_t pos)
      : buffer_(buffer), head_(head), pos_(pos) {}

  RingBuffer* buffer_;
  uint64_t head_;
  uint64_t pos_;
};

/// RingBufferReader waits until one of its buffers has data
class RingBufferReader {
 public:
  explicit RingBufferReader(std::vector<RingBuffer*> buffers);

  /// Wait up to timeout_ms for data
  /// @return Indices of the buffers that have data (possibly empty)
  std::vector<size_t> poll(int timeout_ms);

  size_t size() const { return buffers_.size(); }
  RingBuffer* buffer(size_t index) const { return buffers_[index]; }

 private:
  std::vector<RingBuffer*> buffers_;
  // Buffers whose descriptor hung up are only checked, never polled
  std::vector<bool> hung_up_;
};

}  // namespace sampling
}  // namespace perfscope

#endif  // PERFSCOPE_SAMPLING_RING_BUFFER_H_
