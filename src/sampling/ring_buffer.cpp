// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "sampling/ring_buffer.h"

#include <poll.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "common/log.h"

namespace perfscope {
namespace sampling {

RingBuffer::RingBuffer(std::unique_ptr<MappedRegion> region, int cpu)
    : region_(std::move(region)),
      header_(region_->header()),
      data_(region_->data()),
      capacity_(region_->data_size()),
      mask_(static_cast<uint64_t>(region_->data_size()) - 1),
      cpu_(cpu),
      scratch_((region_->data_size() + sizeof(uint64_t) - 1) /
               sizeof(uint64_t)),
      tail_(0),
      drained_bytes_(0),
      size_hint_(sizeof(uint64_t)),
      records_(0),
      lost_samples_(0),
      corrupt_events_(0) {
  tail_ = __atomic_load_n(&header_->data_tail, __ATOMIC_RELAXED);
}

uint64_t RingBuffer::load_head() const {
  return __atomic_load_n(&header_->data_head, __ATOMIC_ACQUIRE);
}

void RingBuffer::store_tail(uint64_t tail) {
  __atomic_store_n(&header_->data_tail, tail, __ATOMIC_RELEASE);
}

bool RingBuffer::has_data() const { return load_head() != tail_; }

uint64_t RingBuffer::mean_record_size() const {
  uint64_t records = records_.load(std::memory_order_relaxed);
  if (records == 0 || drained_bytes_ == 0) {
    return size_hint_;
  }
  uint64_t mean = drained_bytes_ / records;
  return mean == 0 ? size_hint_ : mean;
}

void RingBuffer::copy_out(uint64_t pos, size_t len, uint8_t* dst) const {
  size_t offset = static_cast<size_t>(pos & mask_);
  size_t first = capacity_ - offset;
  if (first >= len) {
    std::memcpy(dst, data_ + offset, len);
  } else {
    std::memcpy(dst, data_ + offset, first);
    std::memcpy(dst + first, data_, len - first);
  }
}

DrainBatch RingBuffer::begin_drain() {
  uint64_t head = load_head();
  if (head - tail_ > capacity_) {
    // The producer lapped us: everything between tail and head is gone
    uint64_t lost = (head - tail_) / mean_record_size();
    lost_samples_.fetch_add(lost, std::memory_order_relaxed);
    PERFSCOPE_LOG_WARN("cpu %d ring buffer overrun, ~%llu samples lost", cpu_,
                       static_cast<unsigned long long>(lost));
    tail_ = head;
    store_tail(tail_);
  }
  return DrainBatch(this, head, tail_);
}

DrainBatch::DrainBatch(DrainBatch&& other) noexcept
    : buffer_(other.buffer_), head_(other.head_), pos_(other.pos_) {
  other.buffer_ = nullptr;
}

bool DrainBatch::next(RawRecord* record) {
  if (buffer_ == nullptr) {
    return false;
  }
  uint64_t avail = head_ - pos_;
  if (avail < sizeof(perf_event_header)) {
    return false;
  }

  perf_event_header header;
  buffer_->copy_out(pos_, sizeof(header), reinterpret_cast<uint8_t*>(&header));

  if (header.size == 0 || header.size % 8 != 0 ||
      header.size > buffer_->capacity_) {
    buffer_->corrupt_events_.fetch_add(1, std::memory_order_relaxed);
    PERFSCOPE_LOG_WARN("cpu %d ring buffer corrupt (record size %u)",
                       buffer_->cpu_, static_cast<unsigned>(header.size));
    pos_ = head_;
    return false;
  }
  if (header.size > avail) {
    // Partially written, finish on the next drain
    return false;
  }

  size_t offset = static_cast<size_t>(pos_ & buffer_->mask_);
  const uint8_t* bytes;
  if (offset + header.size <= buffer_->capacity_) {
    bytes = buffer_->data_ + offset;
  } else {
    uint8_t* scratch = reinterpret_cast<uint8_t*>(buffer_->scratch_.data());
    buffer_->copy_out(pos_, header.size, scratch);
    bytes = scratch;
  }

  record->bytes = bytes;
  record->size = header.size;
  record->type = header.type;
  record->misc = header.misc;

  pos_ += header.size;
  buffer_->drained_bytes_ += header.size;
  buffer_->records_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void DrainBatch::end() {
  if (buffer_ == nullptr) {
    return;
  }
  buffer_->tail_ = pos_;
  buffer_->store_tail(pos_);
  buffer_ = nullptr;
}

RingBufferReader::RingBufferReader(std::vector<RingBuffer*> buffers)
    : buffers_(std::move(buffers)), hung_up_(buffers_.size(), false) {}

std::vector<size_t> RingBufferReader::poll(int timeout_ms) {
  std::vector<size_t> ready;
  for (size_t i = 0; i < buffers_.size(); ++i) {
    if (buffers_[i]->has_data()) {
      ready.push_back(i);
    }
  }
  if (!ready.empty()) {
    return ready;
  }

  std::vector<struct pollfd> fds(buffers_.size());
  for (size_t i = 0; i < buffers_.size(); ++i) {
    // poll(2) skips negative descriptors
    fds[i].fd = hung_up_[i] ? -1 : buffers_[i]->poll_fd();
    fds[i].events = POLLIN;
    fds[i].revents = 0;
  }

  int ret = ::poll(fds.data(), fds.size(), timeout_ms);
  if (ret < 0 && errno != EINTR) {
    PERFSCOPE_LOG_WARN("poll on ring buffers failed: %s", strerror(errno));
  }

  for (size_t i = 0; i < buffers_.size(); ++i) {
    if ((fds[i].revents & (POLLHUP | POLLERR | POLLNVAL)) != 0) {
      hung_up_[i] = true;
    }
    if ((fds[i].revents & POLLIN) != 0 || buffers_[i]->has_data()) {
      ready.push_back(i);
    }
  }
  return ready;
}

}  // namespace sampling
}  // namespace perfscope
