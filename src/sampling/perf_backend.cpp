// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "sampling/perf_backend.h"

#include <papi.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <mutex>
#include <string>

#include "common/fs_utils.h"
#include "common/log.h"

namespace perfscope {
namespace sampling {

namespace {

/// Kernel ring buffer mapping
class PerfMappedRegion : public MappedRegion {
 public:
  PerfMappedRegion(void* base, size_t length, size_t page_size, int fd)
      : base_(static_cast<uint8_t*>(base)),
        length_(length),
        page_size_(page_size),
        fd_(fd) {}

  ~PerfMappedRegion() override { munmap(base_, length_); }

  perf_event_mmap_page* header() override {
    return reinterpret_cast<perf_event_mmap_page*>(base_);
  }

  uint8_t* data() override {
    // Older kernels leave data_offset at 0; the data starts on page 2 then
    uint64_t offset = header()->data_offset;
    return base_ + (offset != 0 ? offset : page_size_);
  }

  size_t data_size() const override { return length_ - page_size_; }

  int poll_fd() const override { return fd_; }

 private:
  uint8_t* base_;
  size_t length_;
  size_t page_size_;
  int fd_;
};

int Errno() { return errno != 0 ? errno : EIO; }

}  // namespace

LinuxPerfBackend::LinuxPerfBackend(uint32_t slot_override)
    : slot_override_(slot_override),
      page_size_(static_cast<size_t>(sysconf(_SC_PAGESIZE))) {}

int LinuxPerfBackend::open_event(const perf_event_attr& attr, int pid, int cpu,
                                 int* fd) {
  long ret = syscall(SYS_perf_event_open, &attr, pid, cpu, -1,
                     PERF_FLAG_FD_CLOEXEC);
  if (ret < 0) {
    return Errno();
  }
  *fd = static_cast<int>(ret);
  return 0;
}

void LinuxPerfBackend::close_event(int fd) { close(fd); }

int LinuxPerfBackend::enable(int fd) {
  return ioctl(fd, PERF_EVENT_IOC_ENABLE, 0) == 0 ? 0 : Errno();
}

int LinuxPerfBackend::disable(int fd) {
  return ioctl(fd, PERF_EVENT_IOC_DISABLE, 0) == 0 ? 0 : Errno();
}

int LinuxPerfBackend::event_id(int fd, uint64_t* id) {
  return ioctl(fd, PERF_EVENT_IOC_ID, id) == 0 ? 0 : Errno();
}

int LinuxPerfBackend::set_output(int fd, int target_fd) {
  return ioctl(fd, PERF_EVENT_IOC_SET_OUTPUT, target_fd) == 0 ? 0 : Errno();
}

int LinuxPerfBackend::map_ring_buffer(int fd, size_t data_pages,
                                      std::unique_ptr<MappedRegion>* region) {
  if (data_pages == 0 || (data_pages & (data_pages - 1)) != 0) {
    return EINVAL;
  }
  size_t length = (data_pages + 1) * page_size_;
  void* base = mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
  if (base == MAP_FAILED) {
    return Errno();
  }
  region->reset(new PerfMappedRegion(base, length, page_size_, fd));
  return 0;
}

uint32_t LinuxPerfBackend::DiscoverHardwareSlots() {
  static std::once_flag once;
  static uint32_t slots = 0;
  std::call_once(once, []() {
    if (PAPI_is_initialized() == PAPI_NOT_INITED) {
      int ret = PAPI_library_init(PAPI_VER_CURRENT);
      if (ret != PAPI_VER_CURRENT) {
        PERFSCOPE_LOG_WARN("PAPI library init failed: %s",
                           ret > 0 ? "version mismatch" : PAPI_strerror(ret));
        return;
      }
    }
    int counters = PAPI_num_cmp_hwctrs(0);
    if (counters > 0) {
      slots = static_cast<uint32_t>(counters);
    }
  });
  return slots;
}

uint32_t LinuxPerfBackend::hardware_slot_count() {
  if (slot_override_ != 0) {
    PERFSCOPE_LOG_INFO("hardware counter slots: %u (configured)",
                       slot_override_);
    return slot_override_;
  }
  uint32_t slots = DiscoverHardwareSlots();
  if (slots == 0) {
    PERFSCOPE_LOG_INFO("hardware counter slots: %u (fallback)",
                       kFallbackHardwareSlots);
    return kFallbackHardwareSlots;
  }
  PERFSCOPE_LOG_INFO("hardware counter slots: %u (PAPI)", slots);
  return slots;
}

std::vector<int> LinuxPerfBackend::online_cpus() {
  std::vector<int> cpus;
  std::string content;
  if (ReadFileToString("/sys/devices/system/cpu/online", &content) &&
      ParseCpuList(content, &cpus)) {
    return cpus;
  }
  cpus.clear();
  long count = sysconf(_SC_NPROCESSORS_ONLN);
  for (long i = 0; i < count; ++i) {
    cpus.push_back(static_cast<int>(i));
  }
  return cpus;
}

int LinuxPerfBackend::threads_of(int pid, std::vector<int>* tids) {
  std::string dir = pid == 0 ? std::string("/proc/self/task")
                             : "/proc/" + std::to_string(pid) + "/task";
  std::vector<std::string> names;
  if (!ListDirectory(dir, DirFilter::kDirectories, &names)) {
    return ESRCH;
  }
  for (const auto& name : names) {
    uint64_t tid = 0;
    if (ParseUint64(name, 10, &tid)) {
      tids->push_back(static_cast<int>(tid));
    }
  }
  return tids->empty() ? ESRCH : 0;
}

}  // namespace sampling
}  // namespace perfscope
