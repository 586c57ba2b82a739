// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "analysis/process_maps.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <utility>

#include "common/log.h"
#include "sampling/rotation_schedule.h"

namespace perfscope {
namespace analysis {

namespace {

/// Maximum pathname length for safety
constexpr size_t kMaxPathnameLength = 2047;

bool StartsBefore(const Mapping& a, const Mapping& b) {
  return a.start < b.start;
}

}  // namespace

std::shared_ptr<const std::string> ProcessMaps::intern(
    const std::string& path) {
  auto it = paths_.find(path);
  if (it != paths_.end()) {
    return it->second;
  }
  auto shared = std::make_shared<const std::string>(path);
  paths_.emplace(path, shared);
  return shared;
}

bool ProcessMaps::parse_process(int pid, const std::string& proc_root) {
  std::string path = proc_root + "/" +
                     (pid == 0 ? std::string("self") : std::to_string(pid)) +
                     "/maps";
  return parse_maps_file(path);
}

bool ProcessMaps::parse_maps_file(const std::string& filepath) {
  mappings_.clear();

  FILE* maps_file = std::fopen(filepath.c_str(), "r");
  if (maps_file == nullptr) {
    return false;
  }

  char line[4096];
  while (std::fgets(line, sizeof(line), maps_file) != nullptr) {
    // Keep going past a malformed line
    parse_maps_line(line);
  }
  std::fclose(maps_file);

  std::sort(mappings_.begin(), mappings_.end(), StartsBefore);
  return true;
}

bool ProcessMaps::parse_maps_line(const char* line) {
  unsigned long start_addr = 0;
  unsigned long end_addr = 0;
  unsigned long offset = 0;
  char perms[8] = {0};
  char pathname[kMaxPathnameLength + 1] = {0};

  int fields = std::sscanf(line, "%lx-%lx %7s %lx %*x:%*x %*d %2047[^\n]",
                           &start_addr, &end_addr, perms, &offset, pathname);
  if (fields < 4 || end_addr <= start_addr || std::strlen(perms) < 3) {
    return false;
  }

  Mapping mapping;
  mapping.start = start_addr;
  mapping.end = end_addr;
  mapping.pgoff = offset;
  mapping.executable = perms[2] == 'x';

  if (fields == 5) {
    const char* name = pathname;
    while (*name == ' ' || *name == '\t') ++name;
    size_t len = std::strlen(name);
    while (len > 0 && (name[len - 1] == ' ' || name[len - 1] == '\n')) --len;
    if (len > 0) {
      mapping.path = intern(std::string(name, len));
    }
  }

  // Lines arrive in address order; out-of-order input is sorted by the caller
  if (!mappings_.empty() && mappings_.back().start > mapping.start) {
    mappings_.push_back(mapping);
    std::sort(mappings_.begin(), mappings_.end(), StartsBefore);
  } else {
    mappings_.push_back(mapping);
  }
  return true;
}

void ProcessMaps::insert(const Mapping& mapping) {
  if (mapping.end <= mapping.start) {
    return;
  }
  std::vector<Mapping> result;
  result.reserve(mappings_.size() + 2);
  for (const auto& existing : mappings_) {
    if (existing.end <= mapping.start || existing.start >= mapping.end) {
      result.push_back(existing);
      continue;
    }
    // Keep the parts of the old mapping outside the new one
    if (existing.start < mapping.start) {
      Mapping left = existing;
      left.end = mapping.start;
      result.push_back(left);
    }
    if (existing.end > mapping.end) {
      Mapping right = existing;
      right.start = mapping.end;
      right.pgoff = existing.pgoff + (mapping.end - existing.start);
      result.push_back(right);
    }
  }
  Mapping inserted = mapping;
  if (inserted.path) {
    inserted.path = intern(*inserted.path);
  }
  result.push_back(inserted);
  std::sort(result.begin(), result.end(), StartsBefore);
  mappings_.swap(result);
}

const Mapping* ProcessMaps::find(uint64_t addr) const {
  auto it = std::upper_bound(
      mappings_.begin(), mappings_.end(), addr,
      [](uint64_t value, const Mapping& m) { return value < m.start; });
  if (it == mappings_.begin()) {
    return nullptr;
  }
  --it;
  return it->contains(addr) ? &*it : nullptr;
}

AddressSpaceCache::AddressSpaceCache(std::string proc_root,
                                     uint64_t refresh_interval_ns, Clock clock)
    : proc_root_(std::move(proc_root)),
      refresh_interval_ns_(refresh_interval_ns),
      clock_(clock ? std::move(clock) : Clock(sampling::MonotonicNowNs)) {}

std::shared_ptr<const ProcessMaps> AddressSpaceCache::refresh_locked(
    int pid, Entry* entry, uint64_t now) {
  auto maps = std::make_shared<ProcessMaps>();
  if (!maps->parse_process(pid, proc_root_)) {
    PERFSCOPE_LOG_DEBUG("no maps for pid %d", pid);
  } else {
    PERFSCOPE_LOG_DEBUG("refreshed maps of pid %d (%zu mappings)", pid,
                        maps->size());
  }
  entry->maps = maps;
  entry->last_refresh_ns = now;
  entry->loaded = true;
  ++refreshes_;
  return entry->maps;
}

std::shared_ptr<const ProcessMaps> AddressSpaceCache::get(int pid) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry& entry = entries_[pid];
  if (!entry.loaded) {
    return refresh_locked(pid, &entry, clock_());
  }
  return entry.maps;
}

const Mapping* AddressSpaceCache::lookup(
    int pid, uint64_t addr, std::shared_ptr<const ProcessMaps>* maps) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry& entry = entries_[pid];
  uint64_t now = clock_();
  if (!entry.loaded) {
    refresh_locked(pid, &entry, now);
  }
  *maps = entry.maps;
  const Mapping* mapping = (*maps)->find(addr);
  if (mapping != nullptr) {
    return mapping;
  }
  if (now - entry.last_refresh_ns < refresh_interval_ns_) {
    return nullptr;
  }
  *maps = refresh_locked(pid, &entry, now);
  return (*maps)->find(addr);
}

void AddressSpaceCache::on_mmap(const sampling::MmapEvent& event) {
  Mapping mapping;
  mapping.start = event.start;
  mapping.end = event.start + event.length;
  mapping.pgoff = event.pgoff;
  mapping.executable = event.executable;
  if (!event.filename.empty()) {
    mapping.path = std::make_shared<const std::string>(event.filename);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(static_cast<int>(event.pid));
  if (it == entries_.end() || !it->second.loaded) {
    // Loaded from procfs on first use, which already sees this mapping
    return;
  }
  auto updated = std::make_shared<ProcessMaps>(*it->second.maps);
  updated->insert(mapping);
  it->second.maps = updated;
}

void AddressSpaceCache::drop(int pid) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(pid);
}

void AddressSpaceCache::put(int pid, std::shared_ptr<const ProcessMaps> maps) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry& entry = entries_[pid];
  entry.maps = std::move(maps);
  entry.last_refresh_ns = clock_();
  entry.loaded = true;
}

size_t AddressSpaceCache::refresh_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return refreshes_;
}

size_t AddressSpaceCache::process_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace analysis
}  // namespace perfscope
