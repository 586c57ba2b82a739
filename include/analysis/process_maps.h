// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_ANALYSIS_PROCESS_MAPS_H_
#define PERFSCOPE_ANALYSIS_PROCESS_MAPS_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sampling/sample_record.h"

namespace perfscope {
namespace analysis {

/// Default minimum time between two refreshes of one pid
constexpr uint64_t kDefaultMapsRefreshIntervalNs = 50 * 1000 * 1000ULL;

/// One line of /proc/<pid>/maps, or one MMAP2 record
struct Mapping {
  uint64_t start;
  uint64_t end;
  uint64_t pgoff;  // file offset of start
  bool executable;
  std::shared_ptr<const std::string> path;  // file path, "[stack]", ...

  Mapping() : start(0), end(0), pgoff(0), executable(false) {}

  bool contains(uint64_t addr) const { return addr >= start && addr < end; }

  /// Backed by a file that can be opened (absolute path)
  bool is_file() const { return path && !path->empty() && (*path)[0] == '/'; }

  /// File offset of an address inside the mapping
  uint64_t file_offset(uint64_t addr) const { return addr - start + pgoff; }
};

/// ProcessMaps holds the memory mappings of one process, sorted by address.
class ProcessMaps {
 public:
  ProcessMaps() = default;

  /// Parse /proc/<pid>/maps (pid 0 is this process)
  /// @return false if the file cannot be opened
  bool parse_process(int pid, const std::string& proc_root = "/proc");

  /// Parse a maps file (useful for testing)
  bool parse_maps_file(const std::string& filepath);

  /// Parse one maps line
  /// Format: start-end perms offset dev inode pathname
  /// @return false if the line is malformed
  bool parse_maps_line(const char* line);

  /// Insert a mapping, replacing whatever overlapped it
  void insert(const Mapping& mapping);

  /// @return the mapping containing addr, or nullptr
  const Mapping* find(uint64_t addr) const;

  const std::vector<Mapping>& mappings() const { return mappings_; }
  size_t size() const { return mappings_.size(); }
  bool empty() const { return mappings_.empty(); }
  void clear() { mappings_.clear(); }

 private:
  std::shared_ptr<const std::string> intern(const std::string& path);

  std::vector<Mapping> mappings_;
  std::unordered_map<std::string, std::shared_ptr<const std::string>> paths_;
};

/// AddressSpaceCache keeps one ProcessMaps snapshot per pid, shared between
/// drain tasks. Snapshots are immutable: updates publish a new one, so a
/// reader can keep using the snapshot it holds.
class AddressSpaceCache {
 public:
  using Clock = std::function<uint64_t()>;

  explicit AddressSpaceCache(
      std::string proc_root = "/proc",
      uint64_t refresh_interval_ns = kDefaultMapsRefreshIntervalNs,
      Clock clock = nullptr);

  /// Snapshot for pid, loading it on first use. Never null.
  std::shared_ptr<const ProcessMaps> get(int pid);

  /// Find the mapping of addr. A miss refreshes the pid from procfs unless
  /// it was refreshed less than the refresh interval ago.
  /// @param maps Receives the snapshot the mapping points into
  /// @return nullptr when the address is not mapped
  const Mapping* lookup(int pid, uint64_t addr,
                        std::shared_ptr<const ProcessMaps>* maps);

  /// Apply a PERF_RECORD_MMAP/MMAP2
  void on_mmap(const sampling::MmapEvent& event);

  /// Forget a process (exit or exec)
  void drop(int pid);

  /// Preload a snapshot (testing, or a pid without procfs access)
  void put(int pid, std::shared_ptr<const ProcessMaps> maps);

  size_t refresh_count() const;
  size_t process_count() const;

 private:
  struct Entry {
    std::shared_ptr<const ProcessMaps> maps;
    uint64_t last_refresh_ns = 0;
    bool loaded = false;
  };

  std::shared_ptr<const ProcessMaps> refresh_locked(int pid, Entry* entry,
                                                    uint64_t now);

  std::string proc_root_;
  uint64_t refresh_interval_ns_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::unordered_map<int, Entry> entries_;
  size_t refreshes_ = 0;
};

}  // namespace analysis
}  // namespace perfscope

#endif  // PERFSCOPE_ANALYSIS_PROCESS_MAPS_H_
