// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_SAMPLING_SAMPLE_DECODER_H_
#define PERFSCOPE_SAMPLING_SAMPLE_DECODER_H_

#include <cstddef>
#include <cstdint>
#include <unordered_map>

#include "sampling/sample_record.h"

namespace perfscope {
namespace sampling {

/// Decoder result codes
enum class DecodeResult { kSuccess = 0, kMalformedRecord = 1 };

const char* ToString(DecodeResult result) noexcept;

/// sample_type bits the decoder knows how to walk
extern const uint64_t kDecodableSampleType;

/// Smallest PERF_RECORD_SAMPLE a layout can produce, header included
/// (empty callchain, raw data, branch stack and user stack)
size_t MinSampleSize(const SampleLayout& layout) noexcept;

/// SampleDecoder parses PERF_RECORD_SAMPLE and side-band records.
///
/// Framing comes from the ring buffer: every call receives exactly one
/// record (header included), so a malformed record never affects the
/// records around it.
class SampleDecoder {
 public:
  /// Identifier to descriptor index mapping registered at open time
  struct Entry {
    size_t descriptor;
    SampleLayout layout;
  };

  SampleDecoder() = default;

  /// Register the kernel id of one opened event
  void register_identifier(uint64_t identifier, size_t descriptor,
                           const SampleLayout& layout);

  /// Read the leading PERF_SAMPLE_IDENTIFIER of a sample record and find the
  /// descriptor it belongs to
  /// @return kMalformedRecord for short records and unknown identifiers
  DecodeResult peek_identifier(const uint8_t* bytes, size_t size,
                               const Entry** entry) const;

  /// Decode a PERF_RECORD_SAMPLE with a known layout. Fields are parsed in
  /// the kernel's canonical order and must consume exactly header.size.
  static DecodeResult decode(const uint8_t* bytes, size_t size,
                             const SampleLayout& layout, SampleRecord* record);

  static DecodeResult decode_mmap(const uint8_t* bytes, size_t size,
                                  MmapEvent* event);
  static DecodeResult decode_comm(const uint8_t* bytes, size_t size,
                                  CommEvent* event);
  static DecodeResult decode_task(const uint8_t* bytes, size_t size,
                                  TaskEvent* event);
  static DecodeResult decode_lost(const uint8_t* bytes, size_t size,
                                  LostEvent* event);
  static DecodeResult decode_throttle(const uint8_t* bytes, size_t size,
                                      ThrottleEvent* event);

  size_t identifier_count() const { return entries_.size(); }

 private:
  std::unordered_map<uint64_t, Entry> entries_;
};

}  // namespace sampling
}  // namespace perfscope

#endif  // PERFSCOPE_SAMPLING_SAMPLE_DECODER_H_
