// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_ANALYSIS_PROFILER_H_
#define PERFSCOPE_ANALYSIS_PROFILER_H_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "analysis/aggregator.h"
#include "analysis/process_maps.h"
#include "analysis/profile.h"
#include "analysis/stack_unwinder.h"
#include "analysis/symbol_resolver.h"
#include "common/config.h"
#include "sampling/event_descriptor.h"
#include "sampling/perf_backend.h"
#include "sampling/ring_buffer.h"
#include "sampling/sample_decoder.h"
#include "sampling/session.h"

namespace perfscope {
namespace analysis {

/// Profiler result codes
enum class ProfilerResult {
  kSuccess = 0,
  kConfigError = 1,
  kPermissionDenied = 2,
  kUnsupportedEvent = 3,
  kResourceExhausted = 4,
  kInvalidState = 5
};

const char* ToString(ProfilerResult result) noexcept;

/// Profiler runs a profiling session end to end: it opens the configured
/// events, drains every ring buffer on its own thread, unwinds and
/// aggregates the samples, and rotates the multiplexing schedule.
///
/// Usage:
///   perfscope::ProfilerConfig config;
///   config.LoadFromEnvironment();
///   perfscope::analysis::Profiler profiler(config);
///   profiler.start();
///   ...
///   profiler.stop();
///   auto profile = profiler.snapshot();
class Profiler {
 public:
  /// @param config Run configuration
  /// @param backend Kernel interface, nullptr for the real perf_event_open
  explicit Profiler(ProfilerConfig config,
                    sampling::EventBackend* backend = nullptr);

  /// Stops the run if it is still going
  ~Profiler();

  Profiler(const Profiler&) = delete;
  Profiler& operator=(const Profiler&) = delete;

  /// Open the events of the configuration and start sampling
  ProfilerResult start();

  /// Start sampling explicit descriptors
  ProfilerResult start(const std::vector<sampling::EventDescriptor>& descs);

  /// Disable the events, drain what is left and join every thread.
  /// Idempotent.
  ProfilerResult stop();

  /// Current aggregate. Valid before, during and after a run.
  std::shared_ptr<const Profile> snapshot() const;

  bool running() const { return running_.load(); }

  /// Session of the run, nullptr before start
  const sampling::Session* session() const { return session_.get(); }

  /// Descriptors the run could not use
  const std::vector<sampling::DroppedDescriptor>& dropped() const {
    return dropped_;
  }

  const ProfilerConfig& config() const { return config_; }

 private:
  /// State owned by one drain thread
  struct DrainTask {
    sampling::RingBuffer* buffer;
    std::unique_ptr<sampling::RingBufferReader> reader;
    sampling::SampleDecoder decoder;
    sampling::SampleRecord sample;
    std::unique_ptr<StackUnwinder> unwinder;
    UnwindResult unwound;
    AggregatorShard* shard;
    std::thread thread;
  };

  void drain_loop(DrainTask* task);
  void drain_once(DrainTask* task, bool stop_early);
  void handle_record(DrainTask* task, const sampling::RawRecord& record);
  void rotation_loop();
  int sample_pid(const sampling::SampleRecord& sample) const;

  ProfilerConfig config_;
  std::unique_ptr<sampling::EventBackend> owned_backend_;
  sampling::EventBackend* backend_;

  AddressSpaceCache spaces_;
  SymbolResolver resolver_;
  Aggregator aggregator_;

  std::unique_ptr<sampling::Session> session_;
  std::vector<sampling::DroppedDescriptor> dropped_;
  std::vector<std::unique_ptr<DrainTask>> tasks_;
  int target_pid_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> started_;
  std::atomic<bool> running_;
  std::atomic<bool> stop_drain_;

  std::thread rotation_thread_;
  std::mutex rotation_mutex_;
  std::condition_variable rotation_cv_;
  bool stop_rotation_;
};

}  // namespace analysis
}  // namespace perfscope

#endif  // PERFSCOPE_ANALYSIS_PROFILER_H_
