// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "sampling/session.h"

#include <cerrno>
#include <cstring>
#include <map>
#include <set>
#include <utility>

#include "common/log.h"

namespace perfscope {
namespace sampling {

const char* ToString(SessionResult result) noexcept {
  switch (result) {
    case SessionResult::kSuccess:
      return "ok";
    case SessionResult::kPermissionDenied:
      return "permission denied";
    case SessionResult::kUnsupportedEvent:
      return "unsupported event";
    case SessionResult::kResourceExhausted:
      return "resource exhausted";
    case SessionResult::kInvalidState:
      return "invalid state";
  }
  return "unknown";
}

SessionResult ClassifyErrno(int err) noexcept {
  switch (err) {
    case 0:
      return SessionResult::kSuccess;
    case EACCES:
    case EPERM:
      return SessionResult::kPermissionDenied;
    case EMFILE:
    case ENFILE:
    case ENOMEM:
    case ENOSPC:
    case EBUSY:
      return SessionResult::kResourceExhausted;
    default:
      // ENOENT, EOPNOTSUPP, EINVAL, ENODEV, ESRCH, E2BIG, ...
      return SessionResult::kUnsupportedEvent;
  }
}

Session::Session(EventBackend* backend)
    : backend_(backend), hw_slots_(0), status_(SessionStatus::kOpened) {}

Session::~Session() { close(); }

std::vector<RingBuffer*> Session::buffers() const {
  std::vector<RingBuffer*> result;
  for (const auto& buffer : buffers_) {
    result.push_back(buffer.get());
  }
  return result;
}

uint64_t Session::fixed_period(size_t descriptor) const {
  const EventDescriptor& desc = descs_[descriptor];
  return desc.sampling_mode() == SamplingMode::kPeriod ? desc.sampling_value()
                                                       : 1;
}

void Session::set_enabled(size_t descriptor, bool enabled) {
  for (size_t event : events_of_desc_[descriptor]) {
    int fd = events_[event].fd.get();
    int err = enabled ? backend_->enable(fd) : backend_->disable(fd);
    if (err != 0) {
      PERFSCOPE_LOG_WARN("%s %s on cpu %d failed: %s",
                         enabled ? "enabling" : "disabling",
                         descs_[descriptor].name().c_str(), events_[event].cpu,
                         strerror(err));
    }
  }
}

SessionResult Session::start() {
  SessionStatus status = status_.load();
  if (status != SessionStatus::kOpened && status != SessionStatus::kStopped) {
    return SessionResult::kInvalidState;
  }
  for (size_t desc : schedule_->initial_members()) {
    set_enabled(desc, true);
  }
  schedule_->start();
  status_.store(SessionStatus::kRunning);
  return SessionResult::kSuccess;
}

SessionResult Session::stop() {
  SessionStatus expected = SessionStatus::kRunning;
  if (!status_.compare_exchange_strong(expected, SessionStatus::kStopped)) {
    return expected == SessionStatus::kClosed ? SessionResult::kInvalidState
                                              : SessionResult::kSuccess;
  }
  // Idle first, so a concurrent rotate() can no longer enable a set
  schedule_->stop();
  for (size_t desc = 0; desc < descs_.size(); ++desc) {
    set_enabled(desc, false);
  }
  return SessionResult::kSuccess;
}

SessionResult Session::rotate() {
  if (status_.load() != SessionStatus::kRunning) {
    return SessionResult::kInvalidState;
  }
  schedule_->rotate([this](size_t desc) { set_enabled(desc, false); },
                    [this](size_t desc) { set_enabled(desc, true); });
  return SessionResult::kSuccess;
}

void Session::close() {
  if (status_.load() == SessionStatus::kClosed) {
    return;
  }
  stop();
  buffers_.clear();
  events_.clear();
  status_.store(SessionStatus::kClosed);
}

SessionResult SessionController::open_with_precise_fallback(
    perf_event_attr* attr, bool max_precise, int tid, int cpu, int* fd,
    int* err) {
  if (max_precise) {
    attr->precise_ip = 3;
  }
  while (true) {
    *err = backend_->open_event(*attr, tid, cpu, fd);
    if (*err == 0) {
      return SessionResult::kSuccess;
    }
    SessionResult result = ClassifyErrno(*err);
    if (!max_precise || attr->precise_ip == 0 ||
        result != SessionResult::kUnsupportedEvent) {
      return result;
    }
    attr->precise_ip = attr->precise_ip - 1;
  }
}

SessionResult SessionController::open(
    const std::vector<EventDescriptor>& descs,
    std::unique_ptr<Session>* session,
    std::vector<DroppedDescriptor>* dropped_out) {
  // Everything below is owned locally until the session is complete, so
  // an early return releases what was created so far.
  std::unique_ptr<Session> result(new Session(backend_));
  std::vector<DroppedDescriptor>& dropped = result->dropped_;

  auto drop = [&dropped](size_t index, const EventDescriptor& desc,
                         SessionResult reason, const std::string& detail) {
    PERFSCOPE_LOG_WARN("dropping event %s: %s", desc.name().c_str(),
                       detail.c_str());
    dropped.push_back(DroppedDescriptor{index, desc.name(), reason, detail});
  };
  auto publish_drops = [&dropped, dropped_out]() {
    if (dropped_out != nullptr) {
      *dropped_out = dropped;
    }
  };

  const std::vector<int> online = backend_->online_cpus();
  const size_t wakeup_bytes =
      options_.buffer_pages * backend_->page_size() / 4;

  // (tid, cpu) pairs already carrying the side-band records
  std::set<std::pair<int, int>> sideband_owner;

  for (size_t index = 0; index < descs.size(); ++index) {
    const EventDescriptor& desc = descs[index];
    DescriptorError error = desc.validate();
    if (error != DescriptorError::kNone) {
      drop(index, desc, SessionResult::kUnsupportedEvent, ToString(error));
      continue;
    }

    std::vector<int> cpus;
    if (desc.cpu() == kAllTargets) {
      cpus = online;
    } else {
      cpus.push_back(desc.cpu());
    }

    std::vector<int> tids;
    if (desc.pid() == kAllTargets) {
      tids.push_back(kAllTargets);
    } else {
      int err = backend_->threads_of(desc.pid(), &tids);
      if (err != 0) {
        drop(index, desc, ClassifyErrno(err),
             std::string("no threads: ") + strerror(err));
        continue;
      }
    }

    const size_t accepted = result->descs_.size();
    std::vector<OpenedEvent> opened;
    std::vector<std::pair<int, int>> claimed;
    SessionResult desc_result = SessionResult::kSuccess;
    int desc_err = 0;

    for (int tid : tids) {
      for (int cpu : cpus) {
        perf_event_attr attr = desc.to_attr();
        attr.watermark = 1;
        attr.wakeup_watermark = static_cast<uint32_t>(wakeup_bytes);
        auto key = std::make_pair(tid, cpu);
        bool sideband = sideband_owner.count(key) == 0;
        if (sideband) {
          attr.mmap = 1;
          attr.mmap2 = 1;
          attr.comm = 1;
          attr.comm_exec = 1;
          attr.task = 1;
        }

        int fd = -1;
        int err = 0;
        SessionResult open_result = open_with_precise_fallback(
            &attr, desc.modifiers().max_precise, tid, cpu, &fd, &err);
        if (open_result == SessionResult::kSuccess) {
          OpenedEvent event{accepted, tid, cpu, 0, ScopedEventFd(backend_, fd)};
          err = backend_->event_id(fd, &event.id);
          open_result = ClassifyErrno(err);
          if (open_result == SessionResult::kSuccess) {
            if (sideband) {
              sideband_owner.insert(key);
              claimed.push_back(key);
            }
            opened.push_back(std::move(event));
            continue;
          }
        }

        // A thread that exited after it was listed is not an error
        if (err == ESRCH && desc.pid() != kAllTargets) {
          continue;
        }
        desc_result = open_result;
        desc_err = err;
        break;
      }
      if (desc_result != SessionResult::kSuccess) {
        break;
      }
    }

    if (desc_result == SessionResult::kPermissionDenied ||
        desc_result == SessionResult::kResourceExhausted) {
      PERFSCOPE_LOG_ERROR("opening %s failed: %s (%s)", desc.name().c_str(),
                          ToString(desc_result), strerror(desc_err));
      drop(index, desc, desc_result, strerror(desc_err));
      publish_drops();
      return desc_result;
    }
    if (desc_result != SessionResult::kSuccess || opened.empty()) {
      for (const auto& key : claimed) {
        sideband_owner.erase(key);
      }
      drop(index, desc, SessionResult::kUnsupportedEvent,
           desc_err != 0 ? strerror(desc_err) : "no thread to monitor");
      continue;
    }

    result->descs_.push_back(desc);
    result->events_of_desc_.emplace_back();
    for (auto& event : opened) {
      result->events_of_desc_.back().push_back(result->events_.size());
      result->events_.push_back(std::move(event));
    }
  }

  if (result->descs_.empty()) {
    PERFSCOPE_LOG_ERROR("no event could be opened");
    publish_drops();
    return SessionResult::kUnsupportedEvent;
  }

  // Smallest sample each cpu's buffer can receive, until real sizes are known
  std::map<int, size_t> min_sample_size;
  for (const OpenedEvent& event : result->events_) {
    size_t size = MinSampleSize(result->descs_[event.descriptor].layout());
    auto it = min_sample_size.find(event.cpu);
    if (it == min_sample_size.end() || size < it->second) {
      min_sample_size[event.cpu] = size;
    }
  }

  // One ring buffer per cpu; every other event on the cpu writes into it
  std::map<int, size_t> buffer_owner;
  for (size_t i = 0; i < result->events_.size(); ++i) {
    OpenedEvent& event = result->events_[i];
    auto it = buffer_owner.find(event.cpu);
    if (it == buffer_owner.end()) {
      std::unique_ptr<MappedRegion> region;
      int err = backend_->map_ring_buffer(event.fd.get(),
                                          options_.buffer_pages, &region);
      if (err != 0) {
        PERFSCOPE_LOG_ERROR("mapping ring buffer on cpu %d failed: %s",
                            event.cpu, strerror(err));
        publish_drops();
        return SessionResult::kResourceExhausted;
      }
      auto buffer = std::make_unique<RingBuffer>(std::move(region), event.cpu);
      buffer->set_record_size_hint(min_sample_size[event.cpu]);
      result->buffers_.push_back(std::move(buffer));
      buffer_owner[event.cpu] = i;
    } else {
      int target = result->events_[it->second].fd.get();
      int err = backend_->set_output(event.fd.get(), target);
      if (err != 0) {
        PERFSCOPE_LOG_ERROR("redirecting output on cpu %d failed: %s",
                            event.cpu, strerror(err));
        publish_drops();
        return SessionResult::kResourceExhausted;
      }
    }
    result->decoder_.register_identifier(
        event.id, event.descriptor,
        result->descs_[event.descriptor].layout());
  }

  std::vector<bool> uses_slot;
  bool any_hardware = false;
  for (const auto& desc : result->descs_) {
    uses_slot.push_back(desc.uses_hardware_slot());
    any_hardware = any_hardware || desc.uses_hardware_slot();
  }
  if (options_.hw_slots != 0) {
    result->hw_slots_ = options_.hw_slots;
  } else if (any_hardware) {
    result->hw_slots_ = backend_->hardware_slot_count();
  } else {
    result->hw_slots_ = kFallbackHardwareSlots;
  }
  result->schedule_.reset(
      new RotationSchedule(uses_slot, result->hw_slots_, options_.clock));

  PERFSCOPE_LOG_INFO(
      "session: %zu descriptors, %zu events, %zu buffers, %zu rotation sets "
      "of at most %u",
      result->descs_.size(), result->events_.size(), result->buffers_.size(),
      result->schedule_->set_count(), result->hw_slots_);

  publish_drops();
  *session = std::move(result);
  return SessionResult::kSuccess;
}

}  // namespace sampling
}  // namespace perfscope
