// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "analysis/stack_unwinder.h"

#include <libunwind.h>
#include <linux/perf_event.h>

#include <cstring>
#include <utility>

#include "common/log.h"
#include "sampling/perf_regs.h"

// Not part of the public libunwind API, but exported by every build of it.
// Searches a remote .eh_frame_hdr table for the FDE of ip.
extern "C" int UNW_OBJ(dwarf_search_unwind_table)(unw_addr_space_t as,
                                                  unw_word_t ip,
                                                  unw_dyn_info_t* di,
                                                  unw_proc_info_t* pi,
                                                  int need_unwind_info,
                                                  void* arg);

namespace perfscope {
namespace analysis {

using sampling::SampleLayout;
using sampling::SampleRecord;

namespace {

// Callchain entries at or above this value are PERF_CONTEXT_* markers
constexpr uint64_t kPerfContextMarker = static_cast<uint64_t>(-4095);

// DW_EH_PE_* pointer encodings used by .eh_frame_hdr
constexpr uint8_t kEhPeOmit = 0xff;
constexpr uint8_t kEhPeDatarelSdata4 = 0x3b;

// Encoded size of an absolute or pc-relative .eh_frame_hdr field
size_t EncodedSize(uint8_t encoding) {
  switch (encoding & 0x0f) {
    case 0x02:
    case 0x0a:
      return 2;
    case 0x03:
    case 0x0b:
      return 4;
    case 0x04:
    case 0x0c:
      return 8;
    default:
      return 0;
  }
}

/// pid 0 is the idle task, which has no user address space
const Mapping* FindMapping(AddressSpaceCache* spaces, int pid, uint64_t addr,
                           std::shared_ptr<const ProcessMaps>* maps) {
  if (pid == 0) {
    return nullptr;
  }
  return spaces->lookup(pid, addr, maps);
}

bool LoadStackWord(const SampleRecord& sample, uint64_t stack_base,
                   uint64_t addr, uint64_t* value) {
  uint64_t valid = sample.valid_stack_size();
  if (addr < stack_base || addr - stack_base > valid ||
      valid - (addr - stack_base) < sizeof(uint64_t)) {
    return false;
  }
  *value = sampling::LoadU64(sample.stack_data + (addr - stack_base));
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// StackUnwinder
// ---------------------------------------------------------------------------

StackUnwinder::StackUnwinder(AddressSpaceCache* spaces,
                             const SymbolResolver* resolver, size_t max_depth)
    : spaces_(spaces), resolver_(resolver), stack_(max_depth) {}

void StackUnwinder::unwind(const SampleRecord& sample,
                           const SampleLayout& layout, int pid,
                           UnwindResult* result) {
  result->clear();
  stack_.clear();
  result->truncated = collect(sample, layout, pid, &stack_);

  std::shared_ptr<const ProcessMaps> maps;
  result->frames.reserve(stack_.depth());
  for (size_t i = 0; i < stack_.depth(); ++i) {
    uint64_t address = stack_.frame(i);
    const Mapping* mapping = FindMapping(spaces_, pid, address, &maps);
    CallFrame frame(address, resolver_->resolve(mapping, address, i > 0));
    if (!frame.resolved()) {
      ++result->unresolved;
    }
    result->frames.push_back(std::move(frame));
  }
}

bool StackUnwinder::collect_callchain(const SampleRecord& sample,
                                      CallStack<>* stack) const {
  for (uint64_t i = 0; i < sample.callchain_nr; ++i) {
    uint64_t address = sample.callchain_at(i);
    if (address >= kPerfContextMarker) {
      continue;
    }
    if (!stack->push(address)) {
      return true;
    }
  }
  // The kernel stops at the requested depth without telling
  return stack->full();
}

void StackUnwinder::collect_ip(const SampleRecord& sample,
                               CallStack<>* stack) const {
  if (sample.has(PERF_SAMPLE_IP)) {
    stack->push(sample.ip);
  }
}

std::unique_ptr<StackUnwinder> StackUnwinder::Create(
    UnwindMode mode, AddressSpaceCache* spaces, const SymbolResolver* resolver,
    size_t max_depth) {
  if (mode == UnwindMode::kDwarf) {
    return std::make_unique<DwarfUnwinder>(spaces, resolver, max_depth);
  }
  return std::make_unique<FramePointerUnwinder>(spaces, resolver, max_depth);
}

// ---------------------------------------------------------------------------
// FramePointerUnwinder
// ---------------------------------------------------------------------------

FramePointerUnwinder::FramePointerUnwinder(AddressSpaceCache* spaces,
                                           const SymbolResolver* resolver,
                                           size_t max_depth)
    : StackUnwinder(spaces, resolver, max_depth) {}

bool FramePointerUnwinder::collect(const SampleRecord& sample,
                                   const SampleLayout& layout, int pid,
                                   CallStack<>* stack) {
  if (sample.has(PERF_SAMPLE_CALLCHAIN)) {
    return collect_callchain(sample, stack);
  }
  if (sample.has(PERF_SAMPLE_STACK_USER) && sample.regs_data != nullptr) {
    return walk_frame_pointers(sample, layout, pid, stack);
  }
  collect_ip(sample, stack);
  return false;
}

bool FramePointerUnwinder::walk_frame_pointers(const SampleRecord& sample,
                                               const SampleLayout& layout,
                                               int pid, CallStack<>* stack) {
  uint64_t ip = 0;
  uint64_t sp = 0;
  uint64_t fp = 0;
  if (!sampling::ReadUserRegister(sample, layout.regs_user_mask,
                                  sampling::kPerfRegStackPointer, &sp) ||
      !sampling::ReadUserRegister(sample, layout.regs_user_mask,
                                  sampling::kPerfRegFramePointer, &fp)) {
    collect_ip(sample, stack);
    return false;
  }
  if (!sampling::ReadUserRegister(sample, layout.regs_user_mask,
                                  sampling::kPerfRegInstructionPointer, &ip)) {
    ip = sample.ip;
  }
  stack->push(ip);

  // Each frame holds the caller's frame pointer, then the return address
  while (true) {
    uint64_t next_fp = 0;
    uint64_t ret = 0;
    if (!LoadStackWord(sample, sp, fp, &next_fp) ||
        !LoadStackWord(sample, sp, fp + sizeof(uint64_t), &ret)) {
      // Leaving the copy is truncation only while still inside the stack
      if (fp <= sp) {
        return false;
      }
      std::shared_ptr<const ProcessMaps> maps;
      const Mapping* stack_mapping = FindMapping(spaces_, pid, sp, &maps);
      if (stack_mapping == nullptr) {
        return true;
      }
      return stack_mapping->contains(fp);
    }
    if (ret == 0) {
      return false;
    }
    if (!stack->push(ret)) {
      return true;
    }
    if (next_fp <= fp) {
      return false;
    }
    fp = next_fp;
  }
}

// ---------------------------------------------------------------------------
// DwarfUnwinder
// ---------------------------------------------------------------------------

namespace {

/// Per-sample state handed to the libunwind accessors
struct UnwindContext {
  const SampleRecord* sample;
  const SampleLayout* layout;
  int pid;
  AddressSpaceCache* spaces;
  const SymbolResolver* resolver;
  uint64_t stack_base;  // user sp at sample time
  bool out_of_stack;
};

bool PerfRegisterOf(unw_regnum_t regnum, int* perf_reg) {
#if defined(__x86_64__)
  switch (regnum) {
    case UNW_X86_64_RAX: *perf_reg = PERF_REG_X86_AX; return true;
    case UNW_X86_64_RDX: *perf_reg = PERF_REG_X86_DX; return true;
    case UNW_X86_64_RCX: *perf_reg = PERF_REG_X86_CX; return true;
    case UNW_X86_64_RBX: *perf_reg = PERF_REG_X86_BX; return true;
    case UNW_X86_64_RSI: *perf_reg = PERF_REG_X86_SI; return true;
    case UNW_X86_64_RDI: *perf_reg = PERF_REG_X86_DI; return true;
    case UNW_X86_64_RBP: *perf_reg = PERF_REG_X86_BP; return true;
    case UNW_X86_64_RSP: *perf_reg = PERF_REG_X86_SP; return true;
    case UNW_X86_64_R8: *perf_reg = PERF_REG_X86_R8; return true;
    case UNW_X86_64_R9: *perf_reg = PERF_REG_X86_R9; return true;
    case UNW_X86_64_R10: *perf_reg = PERF_REG_X86_R10; return true;
    case UNW_X86_64_R11: *perf_reg = PERF_REG_X86_R11; return true;
    case UNW_X86_64_R12: *perf_reg = PERF_REG_X86_R12; return true;
    case UNW_X86_64_R13: *perf_reg = PERF_REG_X86_R13; return true;
    case UNW_X86_64_R14: *perf_reg = PERF_REG_X86_R14; return true;
    case UNW_X86_64_R15: *perf_reg = PERF_REG_X86_R15; return true;
    case UNW_X86_64_RIP: *perf_reg = PERF_REG_X86_IP; return true;
    default: return false;
  }
#elif defined(__aarch64__)
  // libunwind and perf number x0..x30, sp and pc the same way
  if (regnum < 0 || regnum >= PERF_REG_ARM64_MAX) {
    return false;
  }
  *perf_reg = static_cast<int>(regnum);
  return true;
#else
  (void)regnum;
  (void)perf_reg;
  return false;
#endif
}

/// Read from the ELF file backing a runtime address
bool ReadMappedFile(UnwindContext* ctx, uint64_t addr, void* dst,
                    size_t len) {
  std::shared_ptr<const ProcessMaps> maps;
  const Mapping* mapping = FindMapping(ctx->spaces, ctx->pid, addr, &maps);
  if (mapping == nullptr || !mapping->is_file() ||
      mapping->end - addr < len) {
    return false;
  }
  auto image = ctx->resolver->image(*mapping->path);
  return image && image->read(mapping->file_offset(addr), dst, len);
}

int FindProcInfo(unw_addr_space_t as, unw_word_t ip, unw_proc_info_t* pi,
                 int need_unwind_info, void* arg) {
  auto* ctx = static_cast<UnwindContext*>(arg);
  std::shared_ptr<const ProcessMaps> maps;
  const Mapping* mapping = FindMapping(ctx->spaces, ctx->pid, ip, &maps);
  if (mapping == nullptr || !mapping->is_file()) {
    return -UNW_ENOINFO;
  }
  auto image = ctx->resolver->image(*mapping->path);
  EhFrameHeader hdr;
  uint64_t mapping_vaddr = 0;
  if (!image || !image->eh_frame_header(&hdr) ||
      !image->file_offset_to_vaddr(mapping->pgoff, &mapping_vaddr)) {
    return -UNW_ENOINFO;
  }

  // version, eh_frame_ptr_enc, fde_count_enc, table_enc
  uint8_t header[4];
  if (!image->read(hdr.offset, header, sizeof(header)) || header[0] != 1 ||
      header[3] != kEhPeDatarelSdata4 || header[2] == kEhPeOmit ||
      (header[2] & 0x70) != 0) {
    return -UNW_ENOINFO;
  }
  size_t ptr_size = EncodedSize(header[1]);
  size_t count_size = EncodedSize(header[2]);
  if (ptr_size == 0 || count_size == 0) {
    return -UNW_ENOINFO;
  }
  uint64_t fde_count = 0;
  if (!image->read(hdr.offset + sizeof(header) + ptr_size, &fde_count,
                   count_size) ||
      fde_count == 0) {
    return -UNW_ENOINFO;
  }

  uint64_t load_bias = mapping->start - mapping_vaddr;
  unw_dyn_info_t di;
  std::memset(&di, 0, sizeof(di));
  di.format = UNW_INFO_FORMAT_REMOTE_TABLE;
  di.start_ip = mapping->start;
  di.end_ip = mapping->end;
  di.u.rti.segbase = load_bias + hdr.vaddr;
  di.u.rti.table_data =
      di.u.rti.segbase + sizeof(header) + ptr_size + count_size;
  // Each entry is an (initial location, fde address) pair of sdata4
  di.u.rti.table_len = fde_count * 2 * sizeof(int32_t) / sizeof(unw_word_t);
  return UNW_OBJ(dwarf_search_unwind_table)(as, ip, &di, pi,
                                            need_unwind_info, arg);
}

void PutUnwindInfo(unw_addr_space_t, unw_proc_info_t*, void*) {}

int GetDynInfoListAddr(unw_addr_space_t, unw_word_t*, void*) {
  return -UNW_ENOINFO;
}

int AccessMem(unw_addr_space_t, unw_word_t addr, unw_word_t* valp, int write,
              void* arg) {
  auto* ctx = static_cast<UnwindContext*>(arg);
  if (write) {
    return -UNW_EINVAL;
  }
  uint64_t value = 0;
  if (LoadStackWord(*ctx->sample, ctx->stack_base, addr, &value)) {
    *valp = static_cast<unw_word_t>(value);
    return 0;
  }
  if (ReadMappedFile(ctx, addr, &value, sizeof(value))) {
    *valp = static_cast<unw_word_t>(value);
    return 0;
  }
  if (addr >= ctx->stack_base) {
    ctx->out_of_stack = true;
  }
  return -UNW_EINVAL;
}

int AccessReg(unw_addr_space_t, unw_regnum_t regnum, unw_word_t* valp,
              int write, void* arg) {
  auto* ctx = static_cast<UnwindContext*>(arg);
  int perf_reg = -1;
  uint64_t value = 0;
  if (write || !PerfRegisterOf(regnum, &perf_reg)) {
    return -UNW_EBADREG;
  }
  if (!sampling::ReadUserRegister(*ctx->sample, ctx->layout->regs_user_mask,
                                  perf_reg, &value)) {
    return -UNW_EBADREG;
  }
  *valp = static_cast<unw_word_t>(value);
  return 0;
}

int AccessFpreg(unw_addr_space_t, unw_regnum_t, unw_fpreg_t*, int, void*) {
  return -UNW_EINVAL;
}

int Resume(unw_addr_space_t, unw_cursor_t*, void*) { return -UNW_EINVAL; }

int GetProcName(unw_addr_space_t, unw_word_t, char*, size_t, unw_word_t*,
                void*) {
  return -UNW_EINVAL;
}

}  // namespace

struct DwarfUnwinder::AddressSpace {
  unw_accessors_t accessors;
  unw_addr_space_t handle;

  AddressSpace() : handle(nullptr) {
    std::memset(&accessors, 0, sizeof(accessors));
    accessors.find_proc_info = FindProcInfo;
    accessors.put_unwind_info = PutUnwindInfo;
    accessors.get_dyn_info_list_addr = GetDynInfoListAddr;
    accessors.access_mem = AccessMem;
    accessors.access_reg = AccessReg;
    accessors.access_fpreg = AccessFpreg;
    accessors.resume = Resume;
    accessors.get_proc_name = GetProcName;
    handle = unw_create_addr_space(&accessors, 0);
    if (handle != nullptr) {
      // Mappings change between samples; the cache would go stale
      unw_set_caching_policy(handle, UNW_CACHE_NONE);
    }
  }

  ~AddressSpace() {
    if (handle != nullptr) {
      unw_destroy_addr_space(handle);
    }
  }
};

DwarfUnwinder::DwarfUnwinder(AddressSpaceCache* spaces,
                             const SymbolResolver* resolver, size_t max_depth)
    : StackUnwinder(spaces, resolver, max_depth),
      space_(std::make_unique<AddressSpace>()) {
  if (space_->handle == nullptr) {
    PERFSCOPE_LOG_WARN("libunwind address space unavailable, "
                       "reporting sampled ip only");
  }
}

DwarfUnwinder::~DwarfUnwinder() = default;

bool DwarfUnwinder::collect(const SampleRecord& sample,
                            const SampleLayout& layout, int pid,
                            CallStack<>* stack) {
  uint64_t sp = 0;
  if (space_->handle == nullptr || !sample.has(PERF_SAMPLE_STACK_USER) ||
      !sampling::ReadUserRegister(sample, layout.regs_user_mask,
                                  sampling::kPerfRegStackPointer, &sp)) {
    if (sample.has(PERF_SAMPLE_CALLCHAIN)) {
      return collect_callchain(sample, stack);
    }
    collect_ip(sample, stack);
    return false;
  }

  UnwindContext ctx{&sample, &layout, pid, spaces_, resolver_, sp, false};
  unw_cursor_t cursor;
  if (unw_init_remote(&cursor, space_->handle, &ctx) != 0) {
    collect_ip(sample, stack);
    return false;
  }

  while (true) {
    unw_word_t ip = 0;
    if (unw_get_reg(&cursor, UNW_REG_IP, &ip) != 0 || ip == 0) {
      break;
    }
    if (!stack->push(static_cast<uint64_t>(ip))) {
      return true;
    }
    int step = unw_step(&cursor);
    if (step <= 0) {
      break;
    }
  }
  return ctx.out_of_stack;
}

}  // namespace analysis
}  // namespace perfscope
