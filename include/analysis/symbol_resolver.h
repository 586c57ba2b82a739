// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_ANALYSIS_SYMBOL_RESOLVER_H_
#define PERFSCOPE_ANALYSIS_SYMBOL_RESOLVER_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "analysis/call_frame.h"
#include "analysis/elf_image.h"
#include "analysis/process_maps.h"

namespace perfscope {
namespace analysis {

/// Demangle a C++ symbol name; other names are returned unchanged
std::string Demangle(const std::string& name);

/// SymbolResolver resolves sampled addresses to function names using the
/// symbol tables of the mapped ELF files:
/// address -> mapping -> file offset -> link-time address (PT_LOAD) ->
/// nearest .symtab/.dynsym function.
///
/// A miss yields an UnresolvedSymbol, never an error. The resolver is shared
/// by all drain tasks and is thread-safe.
class SymbolResolver {
 public:
  /// @param enable_cache Whether to cache resolved symbols per file offset
  explicit SymbolResolver(bool enable_cache = true);
  ~SymbolResolver();

  SymbolResolver(const SymbolResolver&) = delete;
  SymbolResolver& operator=(const SymbolResolver&) = delete;

  /// Resolve an address
  /// @param mapping Mapping containing address, or nullptr
  /// @param address Sampled address
  /// @param return_address Look up address - 1 (non-leaf frames, whose
  ///        address points after the call instruction)
  FrameSymbol resolve(const Mapping* mapping, uint64_t address,
                      bool return_address) const;

  /// Mapped ELF file for a path, nullptr if it cannot be read
  std::shared_ptr<const ElfImage> image(const std::string& path) const;

  /// Clear the symbol cache and the ELF files
  void clear_cache();

  /// Get cache statistics
  struct CacheStats {
    size_t hits;
    size_t misses;
    size_t size;
  };

  CacheStats get_cache_stats() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace analysis
}  // namespace perfscope

#endif  // PERFSCOPE_ANALYSIS_SYMBOL_RESOLVER_H_
