// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

/// @file profile_busy_loop.cpp
/// @brief Profile a busy loop of this process and print the hottest frames
///
/// The run is configured through PERFSCOPE_* environment variables, e.g.
///   PERFSCOPE_EVENTS=task-clock PERFSCOPE_AGGREGATION=flat ./perfscope_busy_loop
/// An optional argument sets the duration of the loop in milliseconds.

#include <time.h>

#include <cstdio>
#include <cstdlib>
#include <string>

#include "perfscope.h"

using namespace perfscope;
using namespace perfscope::analysis;

namespace {

/// Keeps the cpu busy for about duration_ms of thread cpu time
__attribute__((noinline)) double SpinFor(long duration_ms) {
  timespec start;
  clock_gettime(CLOCK_THREAD_CPUTIME_ID, &start);
  volatile double acc = 0.0;
  while (true) {
    for (int i = 0; i < 100000; ++i) {
      acc += static_cast<double>(i) * 0.5;
    }
    timespec now;
    clock_gettime(CLOCK_THREAD_CPUTIME_ID, &now);
    long elapsed_ms = (now.tv_sec - start.tv_sec) * 1000 +
                      (now.tv_nsec - start.tv_nsec) / 1000000;
    if (elapsed_ms >= duration_ms) {
      break;
    }
  }
  return acc;
}

void PrintTree(const CallNode& node, double total, int depth, int max_depth) {
  if (depth > max_depth || total <= 0.0) {
    return;
  }
  std::printf("%*s%6.2f%% %6.2f%%  %s\n", depth * 2, "",
              100.0 * node.inclusive / total, 100.0 * node.exclusive / total,
              node.name().c_str());
  for (const auto& child : node.children) {
    if (child.inclusive / total < 0.01) {
      break;
    }
    PrintTree(child, total, depth + 1, max_depth);
  }
}

}  // namespace

int main(int argc, char** argv) {
  long duration_ms = argc > 1 ? std::strtol(argv[1], nullptr, 10) : 1000;

  ProfilerConfig config;
  std::string bad_variable;
  ConfigResult loaded = config.LoadFromEnvironment(&bad_variable);
  if (loaded != ConfigResult::kSuccess) {
    std::fprintf(stderr, "invalid %s: %s\n", bad_variable.c_str(),
                 ToString(loaded));
    return 1;
  }

  Profiler profiler(config);
  ProfilerResult started = profiler.start();
  if (started != ProfilerResult::kSuccess) {
    std::fprintf(stderr, "cannot start profiling: %s\n", ToString(started));
    return 1;
  }
  for (const auto& dropped : profiler.dropped()) {
    std::fprintf(stderr, "dropped %s: %s\n", dropped.name.c_str(),
                 dropped.detail.c_str());
  }

  SpinFor(duration_ms);
  profiler.stop();

  auto profile = profiler.snapshot();
  const ProfileCounters& counters = profile->counters;
  std::printf("samples %llu  weight %.0f  lost %llu  malformed %llu  "
              "truncated %llu\n",
              static_cast<unsigned long long>(counters.samples),
              counters.total_weight,
              static_cast<unsigned long long>(counters.lost_samples),
              static_cast<unsigned long long>(counters.malformed_records),
              static_cast<unsigned long long>(counters.truncated_stacks));
  for (const auto& desc : profile->descriptors) {
    std::printf("  %-24s enabled %5.1f%%  scale %.3f  weight %.0f\n",
                desc.name.c_str(), 100.0 * desc.enabled_fraction,
                desc.scale_factor, desc.weight);
  }

  if (profile->mode == AggregationMode::kFlat) {
    int shown = 0;
    for (const auto& entry : profile->flat) {
      if (++shown > 20) break;
      std::printf("%6.2f%%  %s\n", 100.0 * entry.weight / counters.total_weight,
                  entry.name().c_str());
    }
  } else {
    PrintTree(profile->root, profile->root.inclusive, 0, 16);
  }
  return 0;
}
