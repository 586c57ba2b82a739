// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "sampling/event_catalog.h"

#include <sys/stat.h>

#include <algorithm>
#include <cstring>
#include <utility>

#include "common/fs_utils.h"

namespace perfscope {
namespace sampling {

namespace {

const char* const kTracefsCandidates[] = {"/sys/kernel/tracing",
                                          "/sys/kernel/debug/tracing"};

bool IsDirectory(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

}  // namespace

EventCatalog::EventCatalog(std::string tracefs_root)
    : tracefs_root_(std::move(tracefs_root)) {
  if (tracefs_root_.empty()) {
    tracefs_root_ = DetectTracefsRoot();
  }
}

const std::vector<SymbolicEventInfo>& EventCatalog::SymbolicEvents() {
  static const std::vector<SymbolicEventInfo> events = {
      {"cpu-cycles", "cycles", EventKind::kHardware, PERF_COUNT_HW_CPU_CYCLES},
      {"instructions", nullptr, EventKind::kHardware,
       PERF_COUNT_HW_INSTRUCTIONS},
      {"cache-references", nullptr, EventKind::kHardware,
       PERF_COUNT_HW_CACHE_REFERENCES},
      {"cache-misses", nullptr, EventKind::kHardware,
       PERF_COUNT_HW_CACHE_MISSES},
      {"branch-instructions", "branches", EventKind::kHardware,
       PERF_COUNT_HW_BRANCH_INSTRUCTIONS},
      {"branch-misses", nullptr, EventKind::kHardware,
       PERF_COUNT_HW_BRANCH_MISSES},
      {"bus-cycles", nullptr, EventKind::kHardware, PERF_COUNT_HW_BUS_CYCLES},
      {"stalled-cycles-frontend", "idle-cycles-frontend", EventKind::kHardware,
       PERF_COUNT_HW_STALLED_CYCLES_FRONTEND},
      {"stalled-cycles-backend", "idle-cycles-backend", EventKind::kHardware,
       PERF_COUNT_HW_STALLED_CYCLES_BACKEND},
      {"ref-cycles", nullptr, EventKind::kHardware,
       PERF_COUNT_HW_REF_CPU_CYCLES},
      {"cpu-clock", nullptr, EventKind::kSoftware, PERF_COUNT_SW_CPU_CLOCK},
      {"task-clock", nullptr, EventKind::kSoftware, PERF_COUNT_SW_TASK_CLOCK},
      {"page-faults", "faults", EventKind::kSoftware,
       PERF_COUNT_SW_PAGE_FAULTS},
      {"context-switches", "cs", EventKind::kSoftware,
       PERF_COUNT_SW_CONTEXT_SWITCHES},
      {"cpu-migrations", "migrations", EventKind::kSoftware,
       PERF_COUNT_SW_CPU_MIGRATIONS},
      {"minor-faults", nullptr, EventKind::kSoftware,
       PERF_COUNT_SW_PAGE_FAULTS_MIN},
      {"major-faults", nullptr, EventKind::kSoftware,
       PERF_COUNT_SW_PAGE_FAULTS_MAJ},
      {"alignment-faults", nullptr, EventKind::kSoftware,
       PERF_COUNT_SW_ALIGNMENT_FAULTS},
      {"emulation-faults", nullptr, EventKind::kSoftware,
       PERF_COUNT_SW_EMULATION_FAULTS},
      {"dummy", nullptr, EventKind::kSoftware, PERF_COUNT_SW_DUMMY},
      {"bpf-output", nullptr, EventKind::kSoftware, PERF_COUNT_SW_BPF_OUTPUT},
      {"cgroup-switches", nullptr, EventKind::kSoftware,
       PERF_COUNT_SW_CGROUP_SWITCHES},
  };
  return events;
}

const SymbolicEventInfo* EventCatalog::FindSymbolic(const std::string& name) {
  for (const auto& event : SymbolicEvents()) {
    if (name == event.name ||
        (event.alias != nullptr && name == event.alias)) {
      return &event;
    }
  }
  return nullptr;
}

std::string EventCatalog::DetectTracefsRoot() {
  for (const char* candidate : kTracefsCandidates) {
    if (IsDirectory(std::string(candidate) + "/events")) {
      return candidate;
    }
  }
  return std::string();
}

bool EventCatalog::tracepoint_id(const std::string& category,
                                 const std::string& name,
                                 uint64_t* id) const {
  if (tracefs_root_.empty() || category.empty() || name.empty() ||
      category.find('/') != std::string::npos ||
      name.find('/') != std::string::npos) {
    return false;
  }
  return ReadUint64File(
      tracefs_root_ + "/events/" + category + "/" + name + "/id", id);
}

std::vector<TracepointInfo> EventCatalog::tracepoints() const {
  std::vector<TracepointInfo> result;
  if (tracefs_root_.empty()) {
    return result;
  }

  const std::string events_dir = tracefs_root_ + "/events";
  std::vector<std::string> categories;
  if (!ListDirectory(events_dir, DirFilter::kDirectories, &categories)) {
    return result;
  }

  for (const auto& category : categories) {
    std::vector<std::string> names;
    if (!ListDirectory(events_dir + "/" + category, DirFilter::kDirectories,
                       &names)) {
      continue;
    }
    for (const auto& name : names) {
      uint64_t id = 0;
      if (tracepoint_id(category, name, &id)) {
        result.push_back(TracepointInfo{category, name, id});
      }
    }
  }

  std::sort(result.begin(), result.end(),
            [](const TracepointInfo& a, const TracepointInfo& b) {
              if (a.category != b.category) return a.category < b.category;
              return a.name < b.name;
            });
  return result;
}

std::vector<std::string> EventCatalog::SymbolicNames() {
  std::vector<std::string> names;
  for (const auto& event : SymbolicEvents()) {
    names.push_back(event.name);
    if (event.alias != nullptr) {
      names.push_back(event.alias);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace sampling
}  // namespace perfscope
