// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "analysis/profiler.h"

#include <linux/perf_event.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <utility>

#include "common/log.h"
#include "sampling/event_catalog.h"
#include "sampling/event_parser.h"

namespace perfscope {
namespace analysis {

using sampling::DecodeResult;
using sampling::RawRecord;
using sampling::SessionResult;

namespace {

ProfilerResult FromSessionResult(SessionResult result) {
  switch (result) {
    case SessionResult::kSuccess:
      return ProfilerResult::kSuccess;
    case SessionResult::kPermissionDenied:
      return ProfilerResult::kPermissionDenied;
    case SessionResult::kUnsupportedEvent:
      return ProfilerResult::kUnsupportedEvent;
    case SessionResult::kResourceExhausted:
      return ProfilerResult::kResourceExhausted;
    case SessionResult::kInvalidState:
      return ProfilerResult::kInvalidState;
  }
  return ProfilerResult::kInvalidState;
}

AggregatorOptions OptionsOf(const ProfilerConfig& config) {
  AggregatorOptions options;
  options.mode = config.aggregation;
  options.frame_merge = config.frame_merge;
  options.flat_first_resolved = config.flat_first_resolved;
  options.max_nodes = config.max_nodes;
  return options;
}

}  // namespace

const char* ToString(ProfilerResult result) noexcept {
  switch (result) {
    case ProfilerResult::kSuccess:
      return "Success";
    case ProfilerResult::kConfigError:
      return "ConfigError";
    case ProfilerResult::kPermissionDenied:
      return "PermissionDenied";
    case ProfilerResult::kUnsupportedEvent:
      return "UnsupportedEvent";
    case ProfilerResult::kResourceExhausted:
      return "ResourceExhausted";
    case ProfilerResult::kInvalidState:
      return "InvalidState";
  }
  return "Unknown";
}

Profiler::Profiler(ProfilerConfig config, sampling::EventBackend* backend)
    : config_(std::move(config)),
      backend_(backend),
      aggregator_(OptionsOf(config_)),
      target_pid_(0),
      started_(false),
      running_(false),
      stop_drain_(false),
      stop_rotation_(false) {
  if (backend_ == nullptr) {
    owned_backend_ =
        std::make_unique<sampling::LinuxPerfBackend>(config_.hw_slots);
    backend_ = owned_backend_.get();
  }
  SetLogLevel(config_.log_level);
}

Profiler::~Profiler() { stop(); }

ProfilerResult Profiler::start() {
  ConfigResult checked = config_.Validate();
  if (checked != ConfigResult::kSuccess) {
    PERFSCOPE_LOG_ERROR("invalid configuration: %s", ToString(checked));
    return ProfilerResult::kConfigError;
  }

  sampling::EventCatalog catalog(config_.tracefs_root);
  sampling::EventParser parser(&catalog);
  std::vector<sampling::EventDescriptor> descs;
  std::string failed;
  checked = config_.BuildDescriptors(parser, &descs, &failed);
  if (checked != ConfigResult::kSuccess) {
    PERFSCOPE_LOG_ERROR("cannot use events \"%s\": %s", failed.c_str(),
                        ToString(checked));
    return ProfilerResult::kConfigError;
  }
  return start(descs);
}

ProfilerResult Profiler::start(
    const std::vector<sampling::EventDescriptor>& descs) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (started_.load()) {
    return ProfilerResult::kInvalidState;
  }

  sampling::SessionOptions options;
  options.buffer_pages = config_.buffer_pages;
  options.hw_slots = config_.hw_slots;
  sampling::SessionController controller(backend_, options);
  SessionResult result = controller.open(descs, &session_, &dropped_);
  if (result != SessionResult::kSuccess) {
    PERFSCOPE_LOG_ERROR("cannot open session: %s", ToString(result));
    session_.reset();
    return FromSessionResult(result);
  }

  target_pid_ = config_.pid == 0 ? static_cast<int>(getpid()) : config_.pid;

  const sampling::Session* session = session_.get();
  aggregator_.set_descriptor_source(
      session->descriptors().size(), [session](size_t index) {
        DescriptorStats stats;
        stats.name = session->descriptors()[index].name();
        stats.enabled_fraction = session->enabled_fraction(index);
        stats.scale_factor = session->scale_factor(index);
        return stats;
      });

  for (sampling::RingBuffer* buffer : session_->buffers()) {
    auto task = std::make_unique<DrainTask>();
    task->buffer = buffer;
    task->reader = std::make_unique<sampling::RingBufferReader>(
        std::vector<sampling::RingBuffer*>{buffer});
    task->decoder = session_->decoder();
    task->unwinder = StackUnwinder::Create(config_.unwind, &spaces_,
                                           &resolver_, config_.max_stack_depth);
    task->shard = aggregator_.create_shard();
    tasks_.push_back(std::move(task));
  }

  result = session_->start();
  if (result != SessionResult::kSuccess) {
    PERFSCOPE_LOG_ERROR("cannot enable events: %s", ToString(result));
    tasks_.clear();
    session_->close();
    return FromSessionResult(result);
  }

  started_.store(true);
  running_.store(true);
  for (auto& task : tasks_) {
    DrainTask* raw = task.get();
    task->thread = std::thread([this, raw]() { drain_loop(raw); });
  }
  if (session_->schedule().needs_rotation()) {
    rotation_thread_ = std::thread([this]() { rotation_loop(); });
  }

  PERFSCOPE_LOG_INFO("profiling %zu events on %zu buffers (%zu dropped)",
                     session_->descriptors().size(), tasks_.size(),
                     dropped_.size());
  return ProfilerResult::kSuccess;
}

ProfilerResult Profiler::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.load()) {
    return ProfilerResult::kSuccess;
  }

  // Disable first so the final drain sees everything the kernel will write
  session_->stop();

  {
    std::lock_guard<std::mutex> rotation_lock(rotation_mutex_);
    stop_rotation_ = true;
  }
  rotation_cv_.notify_all();
  if (rotation_thread_.joinable()) {
    rotation_thread_.join();
  }

  stop_drain_.store(true, std::memory_order_release);
  for (auto& task : tasks_) {
    if (task->thread.joinable()) {
      task->thread.join();
    }
  }

  session_->close();
  running_.store(false);

  auto profile = aggregator_.snapshot();
  PERFSCOPE_LOG_INFO("stopped: %llu samples, %llu lost, %llu malformed",
                     static_cast<unsigned long long>(profile->counters.samples),
                     static_cast<unsigned long long>(
                         profile->counters.lost_samples),
                     static_cast<unsigned long long>(
                         profile->counters.malformed_records));
  return ProfilerResult::kSuccess;
}

std::shared_ptr<const Profile> Profiler::snapshot() const {
  return aggregator_.snapshot();
}

void Profiler::rotation_loop() {
  const auto interval = std::chrono::milliseconds(config_.rotation_interval_ms);
  std::unique_lock<std::mutex> lock(rotation_mutex_);
  while (!rotation_cv_.wait_for(lock, interval,
                                [this]() { return stop_rotation_; })) {
    SessionResult result = session_->rotate();
    // kInvalidState: the session was stopped while we waited
    if (result != SessionResult::kSuccess &&
        result != SessionResult::kInvalidState) {
      PERFSCOPE_LOG_WARN("rotation failed: %s", ToString(result));
    }
  }
}

void Profiler::drain_loop(DrainTask* task) {
  const int timeout = static_cast<int>(config_.poll_interval_ms);
  while (!stop_drain_.load(std::memory_order_acquire)) {
    task->reader->poll(timeout);
    drain_once(task, true);
  }
  // Everything written before the events were disabled
  drain_once(task, false);
}

void Profiler::drain_once(DrainTask* task, bool stop_early) {
  sampling::DrainBatch batch = task->buffer->begin_drain();
  RawRecord record;
  while (batch.next(&record)) {
    handle_record(task, record);
    if (stop_early && stop_drain_.load(std::memory_order_acquire)) {
      break;
    }
  }
  batch.end();
  task->shard->set_ring_counters(task->buffer->lost_samples(),
                                 task->buffer->corrupt_events());
}

int Profiler::sample_pid(const sampling::SampleRecord& sample) const {
  if (sample.has(PERF_SAMPLE_TID)) {
    return static_cast<int>(sample.pid);
  }
  return target_pid_;
}

void Profiler::handle_record(DrainTask* task, const RawRecord& record) {
  switch (record.type) {
    case PERF_RECORD_SAMPLE: {
      const sampling::SampleDecoder::Entry* entry = nullptr;
      if (task->decoder.peek_identifier(record.bytes, record.size, &entry) !=
              DecodeResult::kSuccess ||
          sampling::SampleDecoder::decode(record.bytes, record.size,
                                          entry->layout, &task->sample) !=
              DecodeResult::kSuccess) {
        task->shard->count_malformed();
        return;
      }
      task->unwinder->unwind(task->sample, entry->layout,
                             sample_pid(task->sample), &task->unwound);
      task->shard->ingest(task->sample, entry->descriptor,
                          session_->fixed_period(entry->descriptor),
                          task->unwound,
                          session_->scale_factor(entry->descriptor));
      return;
    }
    case PERF_RECORD_MMAP:
    case PERF_RECORD_MMAP2: {
      sampling::MmapEvent event;
      if (sampling::SampleDecoder::decode_mmap(record.bytes, record.size,
                                               &event) !=
          DecodeResult::kSuccess) {
        task->shard->count_malformed();
        return;
      }
      spaces_.on_mmap(event);
      return;
    }
    case PERF_RECORD_COMM: {
      sampling::CommEvent event;
      if (sampling::SampleDecoder::decode_comm(record.bytes, record.size,
                                               &event) !=
          DecodeResult::kSuccess) {
        task->shard->count_malformed();
        return;
      }
      if (event.exec) {
        spaces_.drop(static_cast<int>(event.pid));
      }
      return;
    }
    case PERF_RECORD_EXIT: {
      sampling::TaskEvent event;
      if (sampling::SampleDecoder::decode_task(record.bytes, record.size,
                                               &event) !=
          DecodeResult::kSuccess) {
        task->shard->count_malformed();
        return;
      }
      if (event.pid == event.tid) {
        spaces_.drop(static_cast<int>(event.pid));
      }
      return;
    }
    case PERF_RECORD_LOST: {
      sampling::LostEvent event;
      if (sampling::SampleDecoder::decode_lost(record.bytes, record.size,
                                               &event) !=
          DecodeResult::kSuccess) {
        task->shard->count_malformed();
        return;
      }
      task->buffer->add_lost(event.lost);
      return;
    }
    case PERF_RECORD_THROTTLE: {
      sampling::ThrottleEvent event;
      if (sampling::SampleDecoder::decode_throttle(record.bytes, record.size,
                                                   &event) !=
          DecodeResult::kSuccess) {
        task->shard->count_malformed();
        return;
      }
      task->shard->count_throttle();
      return;
    }
    default:
      // FORK, UNTHROTTLE and newer side-band records carry nothing we use
      return;
  }
}

}  // namespace analysis
}  // namespace perfscope
