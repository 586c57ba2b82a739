// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "sampling/sample_decoder.h"

#include <linux/perf_event.h>
#include <sys/mman.h>

#include <cstring>

namespace perfscope {
namespace sampling {

const uint64_t kDecodableSampleType =
    PERF_SAMPLE_IDENTIFIER | PERF_SAMPLE_IP | PERF_SAMPLE_TID |
    PERF_SAMPLE_TIME | PERF_SAMPLE_ADDR | PERF_SAMPLE_ID |
    PERF_SAMPLE_STREAM_ID | PERF_SAMPLE_CPU | PERF_SAMPLE_PERIOD |
    PERF_SAMPLE_READ | PERF_SAMPLE_CALLCHAIN | PERF_SAMPLE_RAW |
    PERF_SAMPLE_BRANCH_STACK | PERF_SAMPLE_REGS_USER |
    PERF_SAMPLE_STACK_USER | PERF_SAMPLE_WEIGHT | PERF_SAMPLE_DATA_SRC |
    PERF_SAMPLE_TRANSACTION | PERF_SAMPLE_WEIGHT_STRUCT;

namespace {

/// Bounds-checked forward reader over one record
class RecordCursor {
 public:
  RecordCursor(const uint8_t* bytes, size_t size)
      : bytes_(bytes), size_(size), pos_(sizeof(perf_event_header)) {}

  size_t remaining() const { return size_ - pos_; }
  bool at_end() const { return pos_ == size_; }

  bool u64(uint64_t* value) {
    if (remaining() < sizeof(uint64_t)) return false;
    *value = LoadU64(bytes_ + pos_);
    pos_ += sizeof(uint64_t);
    return true;
  }

  bool u32(uint32_t* value) {
    if (remaining() < sizeof(uint32_t)) return false;
    std::memcpy(value, bytes_ + pos_, sizeof(uint32_t));
    pos_ += sizeof(uint32_t);
    return true;
  }

  /// Take a view of `count` elements of `elem_size` bytes
  bool view(uint64_t count, size_t elem_size, const uint8_t** out) {
    if (count > remaining() / elem_size) return false;
    *out = bytes_ + pos_;
    pos_ += static_cast<size_t>(count) * elem_size;
    return true;
  }

  /// NUL terminated string padded to the end of the record
  bool tail_string(std::string_view* out) {
    const uint8_t* start = bytes_ + pos_;
    const void* nul = std::memchr(start, '\0', remaining());
    if (nul == nullptr) return false;
    *out = std::string_view(reinterpret_cast<const char*>(start),
                            static_cast<const uint8_t*>(nul) - start);
    pos_ = size_;
    return true;
  }

 private:
  const uint8_t* bytes_;
  size_t size_;
  size_t pos_;
};

bool CheckHeader(const uint8_t* bytes, size_t size, perf_event_header* header) {
  if (bytes == nullptr || size < sizeof(perf_event_header)) {
    return false;
  }
  std::memcpy(header, bytes, sizeof(*header));
  return header->size == size;
}

// Byte length of a PERF_SAMPLE_READ payload once `nr` is known
size_t ReadPayloadSize(uint64_t read_format, uint64_t nr) {
  size_t fixed = 0;
  if (read_format & PERF_FORMAT_TOTAL_TIME_ENABLED) fixed += 8;
  if (read_format & PERF_FORMAT_TOTAL_TIME_RUNNING) fixed += 8;
  size_t per_value = 8;
  if (read_format & PERF_FORMAT_ID) per_value += 8;
  if (read_format & PERF_FORMAT_LOST) per_value += 8;
  if (read_format & PERF_FORMAT_GROUP) {
    return 8 + fixed + static_cast<size_t>(nr) * per_value;
  }
  return fixed + per_value;
}

}  // namespace

size_t MinSampleSize(const SampleLayout& layout) noexcept {
  const uint64_t st = layout.sample_type;
  size_t size = sizeof(perf_event_header);
  const uint64_t fixed_fields[] = {
      PERF_SAMPLE_IDENTIFIER, PERF_SAMPLE_IP,        PERF_SAMPLE_TID,
      PERF_SAMPLE_TIME,       PERF_SAMPLE_ADDR,      PERF_SAMPLE_ID,
      PERF_SAMPLE_STREAM_ID,  PERF_SAMPLE_CPU,       PERF_SAMPLE_PERIOD,
      PERF_SAMPLE_CALLCHAIN,  PERF_SAMPLE_RAW,       PERF_SAMPLE_BRANCH_STACK,
      PERF_SAMPLE_REGS_USER,  PERF_SAMPLE_STACK_USER, PERF_SAMPLE_DATA_SRC,
      PERF_SAMPLE_TRANSACTION};
  for (uint64_t field : fixed_fields) {
    if (st & field) size += sizeof(uint64_t);
  }
  if (st & PERF_SAMPLE_READ) size += ReadPayloadSize(layout.read_format, 0);
  if ((st & PERF_SAMPLE_BRANCH_STACK) &&
      (layout.branch_sample_type & PERF_SAMPLE_BRANCH_HW_INDEX)) {
    size += sizeof(uint64_t);
  }
  if (st & (PERF_SAMPLE_WEIGHT | PERF_SAMPLE_WEIGHT_STRUCT)) {
    size += sizeof(uint64_t);
  }
  return size;
}

const char* ToString(DecodeResult result) noexcept {
  switch (result) {
    case DecodeResult::kSuccess:
      return "ok";
    case DecodeResult::kMalformedRecord:
      return "malformed record";
  }
  return "unknown";
}

void SampleDecoder::register_identifier(uint64_t identifier, size_t descriptor,
                                        const SampleLayout& layout) {
  entries_[identifier] = Entry{descriptor, layout};
}

DecodeResult SampleDecoder::peek_identifier(const uint8_t* bytes, size_t size,
                                            const Entry** entry) const {
  perf_event_header header;
  if (!CheckHeader(bytes, size, &header) ||
      header.type != PERF_RECORD_SAMPLE ||
      size < sizeof(header) + sizeof(uint64_t)) {
    return DecodeResult::kMalformedRecord;
  }
  uint64_t identifier = LoadU64(bytes + sizeof(header));
  auto it = entries_.find(identifier);
  if (it == entries_.end()) {
    return DecodeResult::kMalformedRecord;
  }
  *entry = &it->second;
  return DecodeResult::kSuccess;
}

DecodeResult SampleDecoder::decode(const uint8_t* bytes, size_t size,
                                   const SampleLayout& layout,
                                   SampleRecord* record) {
  perf_event_header header;
  if (!CheckHeader(bytes, size, &header) ||
      header.type != PERF_RECORD_SAMPLE ||
      (layout.sample_type & ~kDecodableSampleType) != 0) {
    return DecodeResult::kMalformedRecord;
  }

  const uint64_t st = layout.sample_type;
  RecordCursor cur(bytes, size);
  record->reset();
  record->present = st;

#define PERFSCOPE_TAKE(expr)                 \
  do {                                       \
    if (!(expr)) {                           \
      return DecodeResult::kMalformedRecord; \
    }                                        \
  } while (false)

  if (st & PERF_SAMPLE_IDENTIFIER) PERFSCOPE_TAKE(cur.u64(&record->identifier));
  if (st & PERF_SAMPLE_IP) PERFSCOPE_TAKE(cur.u64(&record->ip));
  if (st & PERF_SAMPLE_TID) {
    PERFSCOPE_TAKE(cur.u32(&record->pid));
    PERFSCOPE_TAKE(cur.u32(&record->tid));
  }
  if (st & PERF_SAMPLE_TIME) PERFSCOPE_TAKE(cur.u64(&record->time));
  if (st & PERF_SAMPLE_ADDR) PERFSCOPE_TAKE(cur.u64(&record->addr));
  if (st & PERF_SAMPLE_ID) PERFSCOPE_TAKE(cur.u64(&record->id));
  if (st & PERF_SAMPLE_STREAM_ID) PERFSCOPE_TAKE(cur.u64(&record->stream_id));
  if (st & PERF_SAMPLE_CPU) {
    uint32_t reserved = 0;
    PERFSCOPE_TAKE(cur.u32(&record->cpu));
    PERFSCOPE_TAKE(cur.u32(&reserved));
  }
  if (st & PERF_SAMPLE_PERIOD) PERFSCOPE_TAKE(cur.u64(&record->period));

  if (st & PERF_SAMPLE_READ) {
    uint64_t nr = 0;
    if (layout.read_format & PERF_FORMAT_GROUP) {
      if (cur.remaining() < sizeof(uint64_t)) {
        return DecodeResult::kMalformedRecord;
      }
      nr = LoadU64(bytes + (size - cur.remaining()));
      if (nr > cur.remaining() / 8) {
        return DecodeResult::kMalformedRecord;
      }
    }
    size_t len = ReadPayloadSize(layout.read_format, nr);
    PERFSCOPE_TAKE(cur.view(len, 1, &record->read_data));
    record->read_size = len;
  }

  if (st & PERF_SAMPLE_CALLCHAIN) {
    PERFSCOPE_TAKE(cur.u64(&record->callchain_nr));
    PERFSCOPE_TAKE(cur.view(record->callchain_nr, sizeof(uint64_t),
                            &record->callchain_data));
  }

  if (st & PERF_SAMPLE_RAW) {
    PERFSCOPE_TAKE(cur.u32(&record->raw_size));
    PERFSCOPE_TAKE(cur.view(record->raw_size, 1, &record->raw_data));
  }

  if (st & PERF_SAMPLE_BRANCH_STACK) {
    PERFSCOPE_TAKE(cur.u64(&record->branch_nr));
    if (layout.branch_sample_type & PERF_SAMPLE_BRANCH_HW_INDEX) {
      PERFSCOPE_TAKE(cur.u64(&record->branch_hw_index));
    }
    PERFSCOPE_TAKE(cur.view(record->branch_nr, sizeof(BranchEntry),
                            &record->branch_data));
  }

  if (st & PERF_SAMPLE_REGS_USER) {
    PERFSCOPE_TAKE(cur.u64(&record->regs_abi));
    if (record->regs_abi != PERF_SAMPLE_REGS_ABI_NONE) {
      record->regs_count = static_cast<uint32_t>(
          __builtin_popcountll(layout.regs_user_mask));
      PERFSCOPE_TAKE(cur.view(record->regs_count, sizeof(uint64_t),
                              &record->regs_data));
    }
  }

  if (st & PERF_SAMPLE_STACK_USER) {
    PERFSCOPE_TAKE(cur.u64(&record->stack_size));
    if (record->stack_size != 0) {
      PERFSCOPE_TAKE(cur.view(record->stack_size, 1, &record->stack_data));
      PERFSCOPE_TAKE(cur.u64(&record->stack_dyn_size));
    }
  }

  if (st & (PERF_SAMPLE_WEIGHT | PERF_SAMPLE_WEIGHT_STRUCT)) {
    PERFSCOPE_TAKE(cur.u64(&record->weight));
  }
  if (st & PERF_SAMPLE_DATA_SRC) PERFSCOPE_TAKE(cur.u64(&record->data_src));
  if (st & PERF_SAMPLE_TRANSACTION) {
    PERFSCOPE_TAKE(cur.u64(&record->transaction));
  }

#undef PERFSCOPE_TAKE

  return cur.at_end() ? DecodeResult::kSuccess : DecodeResult::kMalformedRecord;
}

DecodeResult SampleDecoder::decode_mmap(const uint8_t* bytes, size_t size,
                                        MmapEvent* event) {
  perf_event_header header;
  if (!CheckHeader(bytes, size, &header) ||
      (header.type != PERF_RECORD_MMAP && header.type != PERF_RECORD_MMAP2)) {
    return DecodeResult::kMalformedRecord;
  }
  RecordCursor cur(bytes, size);
  MmapEvent out;
  if (!cur.u32(&out.pid) || !cur.u32(&out.tid) || !cur.u64(&out.start) ||
      !cur.u64(&out.length) || !cur.u64(&out.pgoff)) {
    return DecodeResult::kMalformedRecord;
  }
  if (header.type == PERF_RECORD_MMAP2) {
    // maj, min, ino, ino_generation (or the build id form of the same size)
    const uint8_t* ids = nullptr;
    uint32_t prot = 0;
    uint32_t flags = 0;
    if (!cur.view(24, 1, &ids) || !cur.u32(&prot) || !cur.u32(&flags)) {
      return DecodeResult::kMalformedRecord;
    }
    out.executable = (prot & PROT_EXEC) != 0;
  } else {
    out.executable = (header.misc & PERF_RECORD_MISC_MMAP_DATA) == 0;
  }
  if (!cur.tail_string(&out.filename)) {
    return DecodeResult::kMalformedRecord;
  }
  *event = out;
  return DecodeResult::kSuccess;
}

DecodeResult SampleDecoder::decode_comm(const uint8_t* bytes, size_t size,
                                        CommEvent* event) {
  perf_event_header header;
  if (!CheckHeader(bytes, size, &header) || header.type != PERF_RECORD_COMM) {
    return DecodeResult::kMalformedRecord;
  }
  RecordCursor cur(bytes, size);
  CommEvent out;
  if (!cur.u32(&out.pid) || !cur.u32(&out.tid) ||
      !cur.tail_string(&out.comm)) {
    return DecodeResult::kMalformedRecord;
  }
  out.exec = (header.misc & PERF_RECORD_MISC_COMM_EXEC) != 0;
  *event = out;
  return DecodeResult::kSuccess;
}

DecodeResult SampleDecoder::decode_task(const uint8_t* bytes, size_t size,
                                        TaskEvent* event) {
  perf_event_header header;
  if (!CheckHeader(bytes, size, &header) ||
      (header.type != PERF_RECORD_EXIT && header.type != PERF_RECORD_FORK)) {
    return DecodeResult::kMalformedRecord;
  }
  RecordCursor cur(bytes, size);
  TaskEvent out;
  if (!cur.u32(&out.pid) || !cur.u32(&out.ppid) || !cur.u32(&out.tid) ||
      !cur.u32(&out.ptid) || !cur.u64(&out.time)) {
    return DecodeResult::kMalformedRecord;
  }
  *event = out;
  return DecodeResult::kSuccess;
}

DecodeResult SampleDecoder::decode_lost(const uint8_t* bytes, size_t size,
                                        LostEvent* event) {
  perf_event_header header;
  if (!CheckHeader(bytes, size, &header) || header.type != PERF_RECORD_LOST) {
    return DecodeResult::kMalformedRecord;
  }
  RecordCursor cur(bytes, size);
  LostEvent out;
  if (!cur.u64(&out.id) || !cur.u64(&out.lost)) {
    return DecodeResult::kMalformedRecord;
  }
  *event = out;
  return DecodeResult::kSuccess;
}

DecodeResult SampleDecoder::decode_throttle(const uint8_t* bytes, size_t size,
                                            ThrottleEvent* event) {
  perf_event_header header;
  if (!CheckHeader(bytes, size, &header) ||
      (header.type != PERF_RECORD_THROTTLE &&
       header.type != PERF_RECORD_UNTHROTTLE)) {
    return DecodeResult::kMalformedRecord;
  }
  RecordCursor cur(bytes, size);
  ThrottleEvent out;
  if (!cur.u64(&out.time) || !cur.u64(&out.id) || !cur.u64(&out.stream_id)) {
    return DecodeResult::kMalformedRecord;
  }
  out.throttled = header.type == PERF_RECORD_THROTTLE;
  *event = out;
  return DecodeResult::kSuccess;
}

}  // namespace sampling
}  // namespace perfscope
