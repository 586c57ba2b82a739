// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_ANALYSIS_CALL_FRAME_H_
#define PERFSCOPE_ANALYSIS_CALL_FRAME_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace perfscope {
namespace analysis {

/// Name rendered for frames without a symbol
constexpr const char* kUnknownSymbol = "unknown";

/// A frame whose function was found
struct ResolvedSymbol {
  std::shared_ptr<const std::string> module;  // file path of the mapping
  uint64_t offset;                            // offset from function start
  std::string name;                           // demangled
};

/// A frame without a symbol. The module is known when the address fell into
/// a file mapping.
struct UnresolvedSymbol {
  uint64_t address;
  std::shared_ptr<const std::string> module;  // may be null
  uint64_t offset;                            // file offset within module
};

using FrameSymbol = std::variant<ResolvedSymbol, UnresolvedSymbol>;

/// CallFrame is one entry of an unwound stack
struct CallFrame {
  uint64_t address;
  FrameSymbol symbol;

  CallFrame() : address(0), symbol(UnresolvedSymbol{0, nullptr, 0}) {}
  CallFrame(uint64_t addr, FrameSymbol sym)
      : address(addr), symbol(std::move(sym)) {}

  bool resolved() const {
    return std::holds_alternative<ResolvedSymbol>(symbol);
  }

  /// Function name, or "unknown"
  const std::string& name() const;

  /// Module path, or an empty string
  const std::string& module() const;
};

/// Frames of one sample, innermost first
using FrameList = std::vector<CallFrame>;

}  // namespace analysis
}  // namespace perfscope

#endif  // PERFSCOPE_ANALYSIS_CALL_FRAME_H_
