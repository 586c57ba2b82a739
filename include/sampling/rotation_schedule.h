// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_SAMPLING_ROTATION_SCHEDULE_H_
#define PERFSCOPE_SAMPLING_ROTATION_SCHEDULE_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace perfscope {
namespace sampling {

/// Default number of rotation intervals remembered
constexpr size_t kDefaultRotationHistory = 1024;

/// Monotonic clock in nanoseconds
uint64_t MonotonicNowNs() noexcept;

/// One interval during which a rotation set was enabled
struct RotationInterval {
  uint64_t start_ns;
  uint64_t end_ns;
  size_t set;
};

/// Rotation state
enum class RotationState {
  kIdle = 0,    // not started, or stopped
  kActive = 1,  // one set enabled
};

/// RotationSchedule partitions the hardware descriptors of a session into
/// sets of at most `slots` members, cycles through them and keeps the
/// enabled-time accounting used to scale sample weights.
///
/// Descriptors that do not use a hardware slot are always on.
/// Every method takes the accounting lock; none touches a ring buffer.
/// rotate() holds it only around the accounting update, not while the
/// counters are toggled, so readers of the scale factors never wait for
/// the toggle sweep.
class RotationSchedule {
 public:
  using Clock = std::function<uint64_t()>;
  using Toggle = std::function<void(size_t descriptor)>;

  /// @param uses_slot One entry per descriptor
  /// @param slots Hardware counters available at once (at least 1)
  RotationSchedule(const std::vector<bool>& uses_slot, uint32_t slots,
                   Clock clock = MonotonicNowNs,
                   size_t history_capacity = kDefaultRotationHistory);

  size_t descriptor_count() const { return set_of_.size(); }
  size_t set_count() const { return sets_.size(); }
  const std::vector<size_t>& set_members(size_t set) const {
    return sets_[set];
  }
  bool needs_rotation() const { return sets_.size() > 1; }
  bool always_on(size_t descriptor) const {
    return set_of_[descriptor] == kNoSet;
  }

  /// Descriptors to enable at start: always-on ones and the first set
  std::vector<size_t> initial_members() const;

  /// Begin accounting with the first set active
  void start();

  /// Close the open interval and stop accounting
  void stop();

  /// One step of the state machine:
  /// active set i -> disable i -> enable (i+1) mod n -> account.
  /// @return false when idle or when there is a single set
  bool rotate(const Toggle& disable, const Toggle& enable);

  RotationState state() const;
  size_t active_set() const;

  /// Time the session has been started, including the open interval
  uint64_t elapsed_ns() const;

  /// Time the descriptor has been enabled, including the open interval
  uint64_t enabled_ns(size_t descriptor) const;

  /// enabled / elapsed, 1.0 before anything elapsed
  double enabled_fraction(size_t descriptor) const;

  /// elapsed / enabled, 1.0 when nothing elapsed or never enabled
  double scale_factor(size_t descriptor) const;

  /// Recorded intervals, oldest first
  std::vector<RotationInterval> history() const;

  /// Number of completed rotations
  uint64_t rotation_count() const;

 private:
  static constexpr size_t kNoSet = static_cast<size_t>(-1);

  void close_interval_locked(uint64_t now);
  uint64_t enabled_ns_locked(size_t descriptor, uint64_t now) const;
  uint64_t elapsed_ns_locked(uint64_t now) const;

  std::vector<size_t> set_of_;
  std::vector<std::vector<size_t>> sets_;
  Clock clock_;
  size_t history_capacity_;

  // Serializes rotate() with start() and stop()
  std::mutex toggle_mutex_;

  mutable std::mutex mutex_;
  RotationState state_;
  size_t active_;
  uint64_t interval_start_;
  uint64_t elapsed_;
  std::vector<uint64_t> enabled_;
  std::deque<RotationInterval> history_;
  uint64_t rotations_;
};

}  // namespace sampling
}  // namespace perfscope

#endif  // PERFSCOPE_SAMPLING_ROTATION_SCHEDULE_H_
