// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "analysis/symbol_resolver.h"

#include <cxxabi.h>

#include <cstdlib>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "common/log.h"

namespace perfscope {
namespace analysis {

namespace {

// Cache key: file path + file offset
using CacheKey = std::pair<std::string, uint64_t>;

struct CacheKeyHash {
  size_t operator()(const CacheKey& key) const noexcept {
    size_t h1 = std::hash<std::string>{}(key.first);
    size_t h2 = std::hash<uint64_t>{}(key.second);
    return h1 ^ (h2 << 1);
  }
};

struct CachedSymbol {
  bool found;
  std::string name;
  uint64_t offset;  // from function start
};

}  // namespace

std::string Demangle(const std::string& name) {
  if (name.size() < 2 || name[0] != '_' || name[1] != 'Z') {
    return name;
  }
  int status = 0;
  char* demangled = abi::__cxa_demangle(name.c_str(), nullptr, nullptr,
                                        &status);
  if (status != 0 || demangled == nullptr) {
    std::free(demangled);
    return name;
  }
  std::string result(demangled);
  std::free(demangled);
  return result;
}

struct SymbolResolver::Impl {
  bool enable_cache;

  mutable std::mutex mutex;
  mutable std::unordered_map<CacheKey, CachedSymbol, CacheKeyHash> cache;
  mutable std::unordered_map<std::string, std::shared_ptr<const ElfImage>>
      images;
  mutable size_t cache_hits;
  mutable size_t cache_misses;

  explicit Impl(bool cache_enabled)
      : enable_cache(cache_enabled), cache_hits(0), cache_misses(0) {}

  std::shared_ptr<const ElfImage> image_locked(const std::string& path) const {
    auto it = images.find(path);
    if (it != images.end()) {
      return it->second;
    }
    auto image = ElfImage::Open(path);
    if (!image) {
      // Remembered so a missing file is not reopened for every sample
      PERFSCOPE_LOG_DEBUG("cannot read ELF file %s", path.c_str());
    }
    images.emplace(path, image);
    return image;
  }

  CachedSymbol lookup_locked(const std::string& path,
                             uint64_t file_offset) const {
    CachedSymbol result{false, std::string(), 0};
    auto image = image_locked(path);
    if (!image) {
      return result;
    }
    uint64_t vaddr = 0;
    if (!image->file_offset_to_vaddr(file_offset, &vaddr)) {
      return result;
    }
    const ElfSymbol* symbol = image->find_symbol(vaddr);
    if (symbol == nullptr) {
      return result;
    }
    result.found = true;
    result.name = Demangle(std::string(symbol->name));
    result.offset = vaddr - symbol->start;
    return result;
  }
};

SymbolResolver::SymbolResolver(bool enable_cache)
    : impl_(std::make_unique<Impl>(enable_cache)) {}

SymbolResolver::~SymbolResolver() = default;

FrameSymbol SymbolResolver::resolve(const Mapping* mapping, uint64_t address,
                                    bool return_address) const {
  if (mapping == nullptr) {
    return UnresolvedSymbol{address, nullptr, 0};
  }
  uint64_t lookup = return_address && address > mapping->start ? address - 1
                                                                : address;
  uint64_t file_offset = mapping->file_offset(lookup);
  if (!mapping->is_file()) {
    return UnresolvedSymbol{address, mapping->path,
                            mapping->file_offset(address)};
  }

  CachedSymbol symbol;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    CacheKey key(*mapping->path, file_offset);
    auto it = impl_->enable_cache ? impl_->cache.find(key)
                                  : impl_->cache.end();
    if (it != impl_->cache.end()) {
      impl_->cache_hits++;
      symbol = it->second;
    } else {
      if (impl_->enable_cache) {
        impl_->cache_misses++;
      }
      symbol = impl_->lookup_locked(*mapping->path, file_offset);
      if (impl_->enable_cache) {
        impl_->cache.emplace(std::move(key), symbol);
      }
    }
  }

  if (!symbol.found) {
    return UnresolvedSymbol{address, mapping->path,
                            mapping->file_offset(address)};
  }
  return ResolvedSymbol{mapping->path, symbol.offset + (address - lookup),
                        std::move(symbol.name)};
}

std::shared_ptr<const ElfImage> SymbolResolver::image(
    const std::string& path) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->image_locked(path);
}

void SymbolResolver::clear_cache() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->cache.clear();
  impl_->images.clear();
  impl_->cache_hits = 0;
  impl_->cache_misses = 0;
}

SymbolResolver::CacheStats SymbolResolver::get_cache_stats() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return CacheStats{impl_->cache_hits, impl_->cache_misses,
                    impl_->cache.size()};
}

}  // namespace analysis
}  // namespace perfscope
