// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "sampling/event_parser.h"

#include <cctype>

#include "common/fs_utils.h"

namespace perfscope {
namespace sampling {

namespace {

bool IsNameStart(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '*' ||
         c == '?' || c == '[' || c == ']';
}

bool IsNameChar(char c) {
  return IsNameStart(c) || c == '.' || c == '!' || c == '-';
}

// Split on ':' keeping empty parts so "a::b" is rejected
std::vector<std::string> SplitColons(const std::string& text) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t colon = text.find(':', start);
    if (colon == std::string::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, colon - start));
    start = colon + 1;
  }
  return parts;
}

}  // namespace

const char* ToString(ParseResult result) noexcept {
  switch (result) {
    case ParseResult::kSuccess:
      return "ok";
    case ParseResult::kEmpty:
      return "empty event string";
    case ParseResult::kSyntaxError:
      return "syntax error";
    case ParseResult::kUnknownEvent:
      return "unknown event";
    case ParseResult::kUnknownTracepoint:
      return "unknown tracepoint";
    case ParseResult::kInvalidModifier:
      return "invalid modifier";
    case ParseResult::kUnsupportedModifier:
      return "unsupported modifier";
  }
  return "unknown";
}

bool EventParser::IsValidName(const std::string& name) {
  if (name.size() < 2 || !IsNameStart(name[0])) {
    return false;
  }
  for (size_t i = 1; i < name.size(); ++i) {
    if (!IsNameChar(name[i])) {
      return false;
    }
  }
  return true;
}

ParseResult EventParser::ParseModifiers(const std::string& text,
                                        EventModifiers* modifiers,
                                        bool* sample_read) {
  if (text.empty() || text.size() > kMaxModifierCount) {
    return ParseResult::kInvalidModifier;
  }

  bool user = false, kernel = false, hv = false;
  bool guest = false, host = false;
  EventModifiers mods;
  *sample_read = false;

  for (char c : text) {
    switch (c) {
      case 'u': user = true; break;
      case 'k': kernel = true; break;
      case 'h': hv = true; break;
      case 'I': mods.exclude_idle = true; break;
      case 'G': guest = true; break;
      case 'H': host = true; break;
      case 'p':
        if (mods.precise_ip == 3) {
          return ParseResult::kInvalidModifier;
        }
        ++mods.precise_ip;
        break;
      case 'P': mods.max_precise = true; break;
      case 'S': *sample_read = true; break;
      case 'D': mods.pinned = true; break;
      case 'W': mods.weak_group = true; break;
      case 'e': mods.exclusive = true; break;
      case 'b':
        // BPF counter aggregation needs a BPF skeleton we do not ship
        return ParseResult::kUnsupportedModifier;
      default:
        return ParseResult::kInvalidModifier;
    }
  }

  // Naming any privilege level excludes the ones not named
  if (user || kernel || hv) {
    mods.exclude_user = !user;
    mods.exclude_kernel = !kernel;
    mods.exclude_hv = !hv;
  }
  if (guest || host) {
    mods.exclude_guest = !guest;
    mods.exclude_host = !host;
  }
  *modifiers = mods;
  return ParseResult::kSuccess;
}

bool EventParser::parse_raw(const std::string& text, uint64_t* config,
                            std::string* modifiers,
                            bool* has_modifiers) const {
  if (text.size() < 2 || text[0] != 'r') {
    return false;
  }
  size_t pos = 1;
  if (text.compare(pos, 2, "0x") == 0) {
    pos += 2;
  }
  size_t digits_start = pos;
  while (pos < text.size() &&
         std::isxdigit(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  if (pos == digits_start) {
    return false;
  }
  if (pos < text.size() && text[pos] != ':') {
    return false;
  }
  // More than 16 hex digits cannot be a 64-bit encoding
  if (!ParseUint64(text.substr(digits_start, pos - digits_start), 16,
                   config)) {
    return false;
  }
  *has_modifiers = pos < text.size();
  if (*has_modifiers) {
    *modifiers = text.substr(pos + 1);
  }
  return true;
}

ParseResult EventParser::parse(const std::string& text,
                               EventDescriptor* desc) const {
  if (text.empty()) {
    return ParseResult::kEmpty;
  }

  EventModifiers modifiers;
  bool sample_read = false;
  EventDescriptor result;

  uint64_t raw_config = 0;
  std::string modifier_text;
  bool has_modifiers = false;

  if (parse_raw(text, &raw_config, &modifier_text, &has_modifiers)) {
    result = EventDescriptor::Raw(raw_config);
  } else {
    std::vector<std::string> parts = SplitColons(text);
    if (parts.size() > 3) {
      return ParseResult::kSyntaxError;
    }
    for (const auto& part : parts) {
      if (part.empty()) {
        return ParseResult::kSyntaxError;
      }
    }

    const SymbolicEventInfo* symbolic = EventCatalog::FindSymbolic(parts[0]);
    if (parts.size() == 1 || (parts.size() == 2 && symbolic != nullptr)) {
      if (symbolic == nullptr) {
        return IsValidName(parts[0]) ? ParseResult::kUnknownEvent
                                     : ParseResult::kSyntaxError;
      }
      result = symbolic->kind == EventKind::kHardware
                   ? EventDescriptor::Hardware(symbolic->config)
                   : EventDescriptor::Software(symbolic->config);
      has_modifiers = parts.size() == 2;
      if (has_modifiers) {
        modifier_text = parts[1];
      }
    } else {
      if (!IsValidName(parts[0]) || !IsValidName(parts[1])) {
        return ParseResult::kSyntaxError;
      }
      uint64_t id = 0;
      if (catalog_ == nullptr ||
          !catalog_->tracepoint_id(parts[0], parts[1], &id)) {
        return ParseResult::kUnknownTracepoint;
      }
      result = EventDescriptor::Tracepoint(id);
      has_modifiers = parts.size() == 3;
      if (has_modifiers) {
        modifier_text = parts[2];
      }
    }
  }

  if (has_modifiers) {
    ParseResult mod_result =
        ParseModifiers(modifier_text, &modifiers, &sample_read);
    if (mod_result != ParseResult::kSuccess) {
      return mod_result;
    }
  }

  result.set_name(text).set_modifiers(modifiers);
  if (sample_read) {
    result.add_fields(kFieldRead);
  }
  *desc = result;
  return ParseResult::kSuccess;
}

ParseResult EventParser::parse_list(const std::string& text,
                                    std::vector<EventDescriptor>* descs,
                                    std::string* failed) const {
  std::vector<std::string> items;
  Split(text, ", ", &items);
  if (items.empty()) {
    return ParseResult::kEmpty;
  }
  std::vector<EventDescriptor> parsed;
  for (const auto& item : items) {
    EventDescriptor desc;
    ParseResult result = parse(item, &desc);
    if (result != ParseResult::kSuccess) {
      if (failed != nullptr) {
        *failed = item;
      }
      return result;
    }
    parsed.push_back(desc);
  }
  descs->insert(descs->end(), parsed.begin(), parsed.end());
  return ParseResult::kSuccess;
}

}  // namespace sampling
}  // namespace perfscope
