// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "sampling/rotation_schedule.h"

#include <time.h>

#include <utility>

namespace perfscope {
namespace sampling {

uint64_t MonotonicNowNs() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL +
         static_cast<uint64_t>(ts.tv_nsec);
}

RotationSchedule::RotationSchedule(const std::vector<bool>& uses_slot,
                                   uint32_t slots, Clock clock,
                                   size_t history_capacity)
    : set_of_(uses_slot.size(), kNoSet),
      clock_(std::move(clock)),
      history_capacity_(history_capacity),
      state_(RotationState::kIdle),
      active_(0),
      interval_start_(0),
      elapsed_(0),
      enabled_(uses_slot.size(), 0),
      rotations_(0) {
  if (slots == 0) {
    slots = 1;
  }
  // Partition in descriptor order
  for (size_t i = 0; i < uses_slot.size(); ++i) {
    if (!uses_slot[i]) {
      continue;
    }
    if (sets_.empty() || sets_.back().size() == slots) {
      sets_.emplace_back();
    }
    sets_.back().push_back(i);
    set_of_[i] = sets_.size() - 1;
  }
}

std::vector<size_t> RotationSchedule::initial_members() const {
  std::vector<size_t> members;
  for (size_t i = 0; i < set_of_.size(); ++i) {
    if (set_of_[i] == kNoSet || set_of_[i] == 0) {
      members.push_back(i);
    }
  }
  return members;
}

void RotationSchedule::start() {
  std::lock_guard<std::mutex> toggle_lock(toggle_mutex_);
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == RotationState::kActive) {
    return;
  }
  state_ = RotationState::kActive;
  active_ = 0;
  interval_start_ = clock_();
}

void RotationSchedule::stop() {
  // Waits for a rotation in progress, so nothing is enabled after this
  std::lock_guard<std::mutex> toggle_lock(toggle_mutex_);
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != RotationState::kActive) {
    return;
  }
  close_interval_locked(clock_());
  state_ = RotationState::kIdle;
}

bool RotationSchedule::rotate(const Toggle& disable, const Toggle& enable) {
  std::lock_guard<std::mutex> toggle_lock(toggle_mutex_);
  size_t current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != RotationState::kActive || sets_.size() <= 1) {
      return false;
    }
    current = active_;
  }

  // The accounting lock is free while the counters are toggled
  size_t next = (current + 1) % sets_.size();
  for (size_t desc : sets_[current]) {
    disable(desc);
  }
  for (size_t desc : sets_[next]) {
    enable(desc);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  close_interval_locked(clock_());
  active_ = next;
  ++rotations_;
  return true;
}

void RotationSchedule::close_interval_locked(uint64_t now) {
  if (now < interval_start_) {
    now = interval_start_;
  }
  uint64_t span = now - interval_start_;
  elapsed_ += span;
  for (size_t i = 0; i < set_of_.size(); ++i) {
    if (set_of_[i] == kNoSet || set_of_[i] == active_) {
      enabled_[i] += span;
    }
  }
  if (!sets_.empty()) {
    history_.push_back(RotationInterval{interval_start_, now, active_});
    while (history_.size() > history_capacity_) {
      history_.pop_front();
    }
  }
  interval_start_ = now;
}

uint64_t RotationSchedule::elapsed_ns_locked(uint64_t now) const {
  if (state_ == RotationState::kActive && now > interval_start_) {
    return elapsed_ + (now - interval_start_);
  }
  return elapsed_;
}

uint64_t RotationSchedule::enabled_ns_locked(size_t descriptor,
                                             uint64_t now) const {
  uint64_t enabled = enabled_[descriptor];
  if (state_ == RotationState::kActive && now > interval_start_ &&
      (set_of_[descriptor] == kNoSet || set_of_[descriptor] == active_)) {
    enabled += now - interval_start_;
  }
  return enabled;
}

RotationState RotationSchedule::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

size_t RotationSchedule::active_set() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

uint64_t RotationSchedule::elapsed_ns() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return elapsed_ns_locked(clock_());
}

uint64_t RotationSchedule::enabled_ns(size_t descriptor) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_ns_locked(descriptor, clock_());
}

double RotationSchedule::enabled_fraction(size_t descriptor) const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t now = clock_();
  uint64_t elapsed = elapsed_ns_locked(now);
  if (elapsed == 0) {
    return 1.0;
  }
  return static_cast<double>(enabled_ns_locked(descriptor, now)) /
         static_cast<double>(elapsed);
}

double RotationSchedule::scale_factor(size_t descriptor) const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t now = clock_();
  uint64_t elapsed = elapsed_ns_locked(now);
  uint64_t enabled = enabled_ns_locked(descriptor, now);
  if (elapsed == 0 || enabled == 0) {
    return 1.0;
  }
  return static_cast<double>(elapsed) / static_cast<double>(enabled);
}

std::vector<RotationInterval> RotationSchedule::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<RotationInterval>(history_.begin(), history_.end());
}

uint64_t RotationSchedule::rotation_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rotations_;
}

}  // namespace sampling
}  // namespace perfscope
