// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "analysis/elf_image.h"

#include <elf.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace perfscope {
namespace analysis {

namespace {

// Nested or aliased symbols: how far back to look for a covering one
constexpr int kMaxSymbolBacktrack = 8;

bool InRange(uint64_t offset, uint64_t len, size_t size) {
  return offset <= size && len <= size - offset;
}

}  // namespace

ElfImage::ElfImage(std::string path, const uint8_t* base, size_t size)
    : path_(std::move(path)),
      base_(base),
      size_(size),
      has_eh_frame_hdr_(false) {}

ElfImage::~ElfImage() {
  if (base_ != nullptr) {
    munmap(const_cast<uint8_t*>(base_), size_);
  }
}

std::shared_ptr<const ElfImage> ElfImage::Open(const std::string& path) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return nullptr;
  }
  struct stat st;
  if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode) ||
      st.st_size < static_cast<off_t>(sizeof(Elf64_Ehdr))) {
    close(fd);
    return nullptr;
  }
  size_t size = static_cast<size_t>(st.st_size);
  void* base = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
  close(fd);
  if (base == MAP_FAILED) {
    return nullptr;
  }

  std::shared_ptr<ElfImage> image(
      new ElfImage(path, static_cast<const uint8_t*>(base), size));
  if (!image->index()) {
    return nullptr;
  }
  return image;
}

bool ElfImage::index() {
  Elf64_Ehdr ehdr;
  std::memcpy(&ehdr, base_, sizeof(ehdr));
  if (std::memcmp(ehdr.e_ident, ELFMAG, SELFMAG) != 0 ||
      ehdr.e_ident[EI_CLASS] != ELFCLASS64 ||
      ehdr.e_ident[EI_DATA] != ELFDATA2LSB) {
    return false;
  }

  if (ehdr.e_phentsize >= sizeof(Elf64_Phdr) &&
      InRange(ehdr.e_phoff,
              static_cast<uint64_t>(ehdr.e_phnum) * ehdr.e_phentsize,
              size_)) {
    for (uint16_t i = 0; i < ehdr.e_phnum; ++i) {
      Elf64_Phdr phdr;
      std::memcpy(&phdr, base_ + ehdr.e_phoff + i * ehdr.e_phentsize,
                  sizeof(phdr));
      if (phdr.p_type == PT_LOAD) {
        segments_.push_back(ElfSegment{phdr.p_vaddr, phdr.p_offset,
                                       phdr.p_filesz, phdr.p_memsz,
                                       (phdr.p_flags & PF_X) != 0});
      } else if (phdr.p_type == PT_GNU_EH_FRAME) {
        eh_frame_hdr_.vaddr = phdr.p_vaddr;
        eh_frame_hdr_.offset = phdr.p_offset;
        eh_frame_hdr_.size = phdr.p_filesz;
        has_eh_frame_hdr_ = InRange(phdr.p_offset, phdr.p_filesz, size_);
      }
    }
  }

  if (ehdr.e_shentsize >= sizeof(Elf64_Shdr) &&
      InRange(ehdr.e_shoff,
              static_cast<uint64_t>(ehdr.e_shnum) * ehdr.e_shentsize,
              size_)) {
    auto section = [this, &ehdr](uint32_t index, Elf64_Shdr* shdr) {
      std::memcpy(shdr, base_ + ehdr.e_shoff + index * ehdr.e_shentsize,
                  sizeof(*shdr));
    };
    for (uint16_t i = 0; i < ehdr.e_shnum; ++i) {
      Elf64_Shdr shdr;
      section(i, &shdr);
      if ((shdr.sh_type != SHT_SYMTAB && shdr.sh_type != SHT_DYNSYM) ||
          shdr.sh_link >= ehdr.e_shnum) {
        continue;
      }
      Elf64_Shdr strtab;
      section(shdr.sh_link, &strtab);
      load_symbols(shdr.sh_offset, shdr.sh_size, shdr.sh_entsize,
                   strtab.sh_offset, strtab.sh_size);
    }
  }

  std::sort(symbols_.begin(), symbols_.end(),
            [](const ElfSymbol& a, const ElfSymbol& b) {
              if (a.start != b.start) return a.start < b.start;
              return a.size > b.size;
            });
  // .symtab and .dynsym repeat each other
  symbols_.erase(std::unique(symbols_.begin(), symbols_.end(),
                             [](const ElfSymbol& a, const ElfSymbol& b) {
                               return a.start == b.start;
                             }),
                 symbols_.end());
  return true;
}

void ElfImage::load_symbols(uint64_t symtab_offset, uint64_t symtab_size,
                            uint64_t entsize, uint64_t strtab_offset,
                            uint64_t strtab_size) {
  if (entsize < sizeof(Elf64_Sym) || !InRange(symtab_offset, symtab_size, size_) ||
      !InRange(strtab_offset, strtab_size, size_)) {
    return;
  }
  const char* strtab = reinterpret_cast<const char*>(base_ + strtab_offset);
  uint64_t count = symtab_size / entsize;
  for (uint64_t i = 0; i < count; ++i) {
    Elf64_Sym sym;
    std::memcpy(&sym, base_ + symtab_offset + i * entsize, sizeof(sym));
    unsigned type = ELF64_ST_TYPE(sym.st_info);
    if ((type != STT_FUNC && type != STT_GNU_IFUNC) ||
        sym.st_shndx == SHN_UNDEF || sym.st_value == 0 ||
        sym.st_name >= strtab_size) {
      continue;
    }
    const char* name = strtab + sym.st_name;
    size_t max_len = strtab_size - sym.st_name;
    size_t len = strnlen(name, max_len);
    if (len == 0 || len == max_len) {
      continue;
    }
    symbols_.push_back(
        ElfSymbol{sym.st_value, sym.st_size, std::string_view(name, len)});
  }
}

bool ElfImage::file_offset_to_vaddr(uint64_t offset, uint64_t* vaddr) const {
  for (const auto& seg : segments_) {
    if (offset >= seg.offset && offset - seg.offset < seg.filesz) {
      *vaddr = seg.vaddr + (offset - seg.offset);
      return true;
    }
  }
  return false;
}

bool ElfImage::vaddr_to_file_offset(uint64_t vaddr, uint64_t* offset) const {
  for (const auto& seg : segments_) {
    if (vaddr >= seg.vaddr && vaddr - seg.vaddr < seg.filesz) {
      *offset = seg.offset + (vaddr - seg.vaddr);
      return true;
    }
  }
  return false;
}

const ElfSymbol* ElfImage::find_symbol(uint64_t vaddr) const {
  auto it = std::upper_bound(
      symbols_.begin(), symbols_.end(), vaddr,
      [](uint64_t value, const ElfSymbol& sym) { return value < sym.start; });
  for (int step = 0; step < kMaxSymbolBacktrack && it != symbols_.begin();
       ++step) {
    --it;
    if (vaddr - it->start < it->size) {
      return &*it;
    }
    // Size-less symbols (hand written assembly) cover up to the next one
    if (it->size == 0 && step == 0) {
      return &*it;
    }
  }
  return nullptr;
}

bool ElfImage::read(uint64_t offset, void* dst, size_t len) const {
  if (!InRange(offset, len, size_)) {
    return false;
  }
  std::memcpy(dst, base_ + offset, len);
  return true;
}

bool ElfImage::eh_frame_header(EhFrameHeader* header) const {
  if (!has_eh_frame_hdr_) {
    return false;
  }
  *header = eh_frame_hdr_;
  return true;
}

}  // namespace analysis
}  // namespace perfscope
