// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "analysis/call_frame.h"

namespace perfscope {
namespace analysis {

namespace {
const std::string kUnknownName(kUnknownSymbol);
const std::string kNoModule;
}  // namespace

const std::string& CallFrame::name() const {
  if (const auto* resolved = std::get_if<ResolvedSymbol>(&symbol)) {
    return resolved->name;
  }
  return kUnknownName;
}

const std::string& CallFrame::module() const {
  const std::shared_ptr<const std::string>* module = nullptr;
  if (const auto* resolved = std::get_if<ResolvedSymbol>(&symbol)) {
    module = &resolved->module;
  } else {
    module = &std::get<UnresolvedSymbol>(symbol).module;
  }
  return *module ? **module : kNoModule;
}

}  // namespace analysis
}  // namespace perfscope
