// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_SAMPLING_SESSION_H_
#define PERFSCOPE_SAMPLING_SESSION_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sampling/event_descriptor.h"
#include "sampling/perf_backend.h"
#include "sampling/ring_buffer.h"
#include "sampling/rotation_schedule.h"
#include "sampling/sample_decoder.h"

namespace perfscope {
namespace sampling {

/// Session result codes
enum class SessionResult {
  kSuccess = 0,
  kPermissionDenied = 1,   // fatal to open
  kUnsupportedEvent = 2,   // drops one descriptor
  kResourceExhausted = 3,  // fatal to open
  kInvalidState = 4
};

const char* ToString(SessionResult result) noexcept;

/// Map a perf_event_open/ioctl errno to a session result
SessionResult ClassifyErrno(int err) noexcept;

/// Status of a session
enum class SessionStatus {
  kOpened = 0,   // descriptors open and disabled
  kRunning = 1,  // enabled
  kStopped = 2,  // disabled, resources still held
  kClosed = 3    // everything released
};

/// A descriptor the controller refused
struct DroppedDescriptor {
  size_t index;  // position in the list passed to open()
  std::string name;
  SessionResult reason;
  std::string detail;
};

/// Options of the session controller
struct SessionOptions {
  /// Data pages per ring buffer, a power of two
  size_t buffer_pages = 64;

  /// Hardware slots per cpu (0 = ask the backend)
  uint32_t hw_slots = 0;

  /// Clock used for enabled-time accounting
  RotationSchedule::Clock clock = MonotonicNowNs;
};

/// One kernel event: a descriptor on one (thread, cpu) pair
struct OpenedEvent {
  size_t descriptor;
  int tid;
  int cpu;
  uint64_t id;
  ScopedEventFd fd;
};

/// Session owns the kernel side of a profiling run: one event per
/// (descriptor, thread, cpu), one ring buffer per cpu and the multiplexing
/// schedule. Destroying a session releases everything.
class Session {
 public:
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Enable the always-on descriptors and the first rotation set
  SessionResult start();

  /// Disable every descriptor. Idempotent.
  SessionResult stop();

  /// Advance the multiplexing schedule by one set
  /// @return kSuccess even when there is nothing to rotate
  SessionResult rotate();

  /// Stop and release every ring buffer and descriptor. Idempotent.
  void close();

  SessionStatus status() const { return status_.load(); }

  /// Accepted descriptors, indexed by the decoder entries
  const std::vector<EventDescriptor>& descriptors() const { return descs_; }

  const std::vector<DroppedDescriptor>& dropped_descriptors() const {
    return dropped_;
  }

  /// Ring buffers, one per cpu
  std::vector<RingBuffer*> buffers() const;

  /// Identifier to layout mapping. Each drain task copies it.
  const SampleDecoder& decoder() const { return decoder_; }

  const RotationSchedule& schedule() const { return *schedule_; }

  /// Weight multiplier of a descriptor at this moment
  double scale_factor(size_t descriptor) const {
    return schedule_->scale_factor(descriptor);
  }

  double enabled_fraction(size_t descriptor) const {
    return schedule_->enabled_fraction(descriptor);
  }

  /// Period used when a sample does not carry PERF_SAMPLE_PERIOD.
  /// Frequency-mode samples always carry it.
  uint64_t fixed_period(size_t descriptor) const;

  uint32_t hardware_slots() const { return hw_slots_; }

  size_t event_count() const { return events_.size(); }

 private:
  friend class SessionController;

  explicit Session(EventBackend* backend);

  void set_enabled(size_t descriptor, bool enabled);

  EventBackend* backend_;
  std::vector<EventDescriptor> descs_;
  std::vector<DroppedDescriptor> dropped_;
  std::vector<OpenedEvent> events_;
  std::vector<std::vector<size_t>> events_of_desc_;
  std::vector<std::unique_ptr<RingBuffer>> buffers_;
  SampleDecoder decoder_;
  std::unique_ptr<RotationSchedule> schedule_;
  uint32_t hw_slots_;
  std::atomic<SessionStatus> status_;
};

/// SessionController validates descriptors and opens sessions
class SessionController {
 public:
  explicit SessionController(EventBackend* backend,
                             SessionOptions options = SessionOptions())
      : backend_(backend), options_(options) {}

  /// Open every descriptor, disabled.
  ///
  /// Invalid descriptors and descriptors the kernel does not support are
  /// dropped and listed in Session::dropped_descriptors(). Permission and
  /// resource failures are fatal: nothing stays open.
  /// @return kUnsupportedEvent when no descriptor could be opened
  SessionResult open(const std::vector<EventDescriptor>& descs,
                     std::unique_ptr<Session>* session,
                     std::vector<DroppedDescriptor>* dropped = nullptr);

 private:
  SessionResult open_with_precise_fallback(perf_event_attr* attr,
                                           bool max_precise, int tid, int cpu,
                                           int* fd, int* err);

  EventBackend* backend_;
  SessionOptions options_;
};

}  // namespace sampling
}  // namespace perfscope

#endif  // PERFSCOPE_SAMPLING_SESSION_H_
