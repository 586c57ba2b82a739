// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "analysis/profile.h"

namespace perfscope {
namespace analysis {

const CallNode* CallNode::find_child(const std::string& name) const {
  for (const auto& child : children) {
    if (child.name() == name) {
      return &child;
    }
  }
  return nullptr;
}

size_t CallNode::subtree_size() const {
  size_t size = 1;
  for (const auto& child : children) {
    size += child.subtree_size();
  }
  return size;
}

const FlatEntry* Profile::find_flat(const std::string& name) const {
  for (const auto& entry : flat) {
    if (entry.name() == name) {
      return &entry;
    }
  }
  return nullptr;
}

double Profile::flat_weight() const {
  double total = 0.0;
  for (const auto& entry : flat) {
    total += entry.weight;
  }
  return total;
}

}  // namespace analysis
}  // namespace perfscope
