// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_SAMPLING_EVENT_CATALOG_H_
#define PERFSCOPE_SAMPLING_EVENT_CATALOG_H_

#include <cstdint>
#include <string>
#include <vector>

#include "sampling/event_descriptor.h"

namespace perfscope {
namespace sampling {

/// One generic hardware or software event known by name
struct SymbolicEventInfo {
  const char* name;
  const char* alias;  // nullptr when the event has no alias
  EventKind kind;
  uint64_t config;
};

/// One tracepoint present in tracefs
struct TracepointInfo {
  std::string category;
  std::string name;
  uint64_t id;

  std::string full_name() const { return category + ":" + name; }
};

/// EventCatalog knows every event name the parser accepts: the generic
/// hardware/software events and the tracepoints exported by tracefs.
class EventCatalog {
 public:
  /// @param tracefs_root Tracefs mount point; empty means autodetect
  explicit EventCatalog(std::string tracefs_root = std::string());

  /// Generic events in table order (hardware first)
  static const std::vector<SymbolicEventInfo>& SymbolicEvents();

  /// Look up a generic event by name or alias
  /// @return nullptr when unknown
  static const SymbolicEventInfo* FindSymbolic(const std::string& name);

  /// First of /sys/kernel/tracing and /sys/kernel/debug/tracing that has an
  /// events directory, or an empty string
  static std::string DetectTracefsRoot();

  const std::string& tracefs_root() const { return tracefs_root_; }

  /// Resolve category:name to the id used as attr.config
  bool tracepoint_id(const std::string& category, const std::string& name,
                     uint64_t* id) const;

  /// Every tracepoint under <root>/events, sorted by category then name.
  /// Tracepoints whose id is unreadable are skipped.
  std::vector<TracepointInfo> tracepoints() const;

  /// Every symbolic name and alias, sorted
  static std::vector<std::string> SymbolicNames();

 private:
  std::string tracefs_root_;
};

}  // namespace sampling
}  // namespace perfscope

#endif  // PERFSCOPE_SAMPLING_EVENT_CATALOG_H_
