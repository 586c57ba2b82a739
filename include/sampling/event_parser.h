// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_SAMPLING_EVENT_PARSER_H_
#define PERFSCOPE_SAMPLING_EVENT_PARSER_H_

#include <string>
#include <vector>

#include "sampling/event_catalog.h"
#include "sampling/event_descriptor.h"

namespace perfscope {
namespace sampling {

/// Maximum number of modifier characters after ':'
constexpr size_t kMaxModifierCount = 16;

/// Event string parse result codes
enum class ParseResult {
  kSuccess = 0,
  kEmpty = 1,
  kSyntaxError = 2,
  kUnknownEvent = 3,
  kUnknownTracepoint = 4,
  kInvalidModifier = 5,
  kUnsupportedModifier = 6
};

const char* ToString(ParseResult result) noexcept;

/// EventParser turns event strings into descriptors.
///
/// Accepted forms:
///   cpu-cycles            generic event or alias
///   cpu-cycles:upp        generic event with modifiers
///   sched:sched_switch    tracepoint (category:name)
///   sched:sched_switch:k  tracepoint with modifiers
///   r0x1a8 / r1a8:u       raw PMU encoding
///
/// When a string has exactly one ':' and the part before it is a generic
/// event, the part after it is read as modifiers. Otherwise it is a
/// tracepoint.
class EventParser {
 public:
  explicit EventParser(const EventCatalog* catalog) : catalog_(catalog) {}

  /// Parse one event string. The descriptor name is the input text; scope,
  /// sampling and fields keep their defaults.
  ParseResult parse(const std::string& text, EventDescriptor* desc) const;

  /// Parse a comma separated list
  /// @param failed Receives the first event string that failed
  ParseResult parse_list(const std::string& text,
                         std::vector<EventDescriptor>* descs,
                         std::string* failed) const;

  /// Parse the modifier characters (without the leading ':')
  /// @param sample_read Set when 'S' asks for PERF_SAMPLE_READ
  static ParseResult ParseModifiers(const std::string& text,
                                    EventModifiers* modifiers,
                                    bool* sample_read);

  /// Event and category names: [A-Za-z0-9_*?\[\]] followed by at least one
  /// of the same set plus '.', '!' and '-'
  static bool IsValidName(const std::string& name);

 private:
  bool parse_raw(const std::string& text, uint64_t* config,
                 std::string* modifiers, bool* has_modifiers) const;

  const EventCatalog* catalog_;
};

}  // namespace sampling
}  // namespace perfscope

#endif  // PERFSCOPE_SAMPLING_EVENT_PARSER_H_
