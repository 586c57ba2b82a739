// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_ANALYSIS_ELF_IMAGE_H_
#define PERFSCOPE_ANALYSIS_ELF_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace perfscope {
namespace analysis {

/// A function symbol of an ELF file
struct ElfSymbol {
  uint64_t start;  // virtual address
  uint64_t size;
  std::string_view name;  // mangled, points into the mapped file
};

/// A PT_LOAD segment
struct ElfSegment {
  uint64_t vaddr;
  uint64_t offset;
  uint64_t filesz;
  uint64_t memsz;
  bool executable;
};

/// Location of .eh_frame_hdr
struct EhFrameHeader {
  uint64_t vaddr = 0;
  uint64_t offset = 0;
  uint64_t size = 0;
};

/// ElfImage is a read-only mapping of a 64-bit ELF file with its function
/// symbols (.symtab and .dynsym) and load segments indexed.
class ElfImage {
 public:
  ~ElfImage();

  ElfImage(const ElfImage&) = delete;
  ElfImage& operator=(const ElfImage&) = delete;

  /// Map and index a file
  /// @return nullptr when the file is missing or not a supported ELF
  static std::shared_ptr<const ElfImage> Open(const std::string& path);

  const std::string& path() const { return path_; }

  /// Translate a file offset to a link-time virtual address via PT_LOAD
  bool file_offset_to_vaddr(uint64_t offset, uint64_t* vaddr) const;

  /// Translate a link-time virtual address to a file offset via PT_LOAD
  bool vaddr_to_file_offset(uint64_t vaddr, uint64_t* offset) const;

  /// Function containing vaddr, or nullptr
  const ElfSymbol* find_symbol(uint64_t vaddr) const;

  /// Copy bytes at a file offset
  bool read(uint64_t offset, void* dst, size_t len) const;

  /// .eh_frame_hdr location, if the file has one
  bool eh_frame_header(EhFrameHeader* header) const;

  const std::vector<ElfSegment>& segments() const { return segments_; }
  size_t symbol_count() const { return symbols_.size(); }

 private:
  ElfImage(std::string path, const uint8_t* base, size_t size);

  bool index();
  void load_symbols(uint64_t symtab_offset, uint64_t symtab_size,
                    uint64_t entsize, uint64_t strtab_offset,
                    uint64_t strtab_size);

  std::string path_;
  const uint8_t* base_;
  size_t size_;
  std::vector<ElfSegment> segments_;
  std::vector<ElfSymbol> symbols_;  // sorted by start
  EhFrameHeader eh_frame_hdr_;
  bool has_eh_frame_hdr_;
};

}  // namespace analysis
}  // namespace perfscope

#endif  // PERFSCOPE_ANALYSIS_ELF_IMAGE_H_
