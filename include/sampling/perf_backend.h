// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_SAMPLING_PERF_BACKEND_H_
#define PERFSCOPE_SAMPLING_PERF_BACKEND_H_

#include <linux/perf_event.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace perfscope {
namespace sampling {

/// Conservative counter slot count when discovery fails
constexpr uint32_t kFallbackHardwareSlots = 4;

/// MappedRegion owns the memory of one ring buffer: a control page
/// (perf_event_mmap_page) followed by a power-of-two data region.
/// The memory is released when the region is destroyed.
class MappedRegion {
 public:
  virtual ~MappedRegion() = default;

  virtual perf_event_mmap_page* header() = 0;
  virtual uint8_t* data() = 0;
  virtual size_t data_size() const = 0;

  /// Descriptor that becomes readable when the buffer crosses its
  /// wakeup watermark
  virtual int poll_fd() const = 0;
};

/// EventBackend is the kernel seam of the session controller.
/// Every call returns 0 or a positive errno value.
class EventBackend {
 public:
  virtual ~EventBackend() = default;

  virtual int open_event(const perf_event_attr& attr, int pid, int cpu,
                         int* fd) = 0;
  virtual void close_event(int fd) = 0;
  virtual int enable(int fd) = 0;
  virtual int disable(int fd) = 0;
  virtual int event_id(int fd, uint64_t* id) = 0;

  /// Redirect the samples of fd into the ring buffer of target_fd
  virtual int set_output(int fd, int target_fd) = 0;

  /// Map a ring buffer with data_pages data pages on fd
  virtual int map_ring_buffer(int fd, size_t data_pages,
                              std::unique_ptr<MappedRegion>* region) = 0;

  /// Hardware counters usable at the same time on one cpu
  virtual uint32_t hardware_slot_count() = 0;

  /// Online cpu ids
  virtual std::vector<int> online_cpus() = 0;

  /// Thread ids of a process (pid 0 is the calling process)
  virtual int threads_of(int pid, std::vector<int>* tids) = 0;

  virtual size_t page_size() const = 0;
};

/// LinuxPerfBackend talks to perf_event_open(2) and friends
class LinuxPerfBackend : public EventBackend {
 public:
  /// @param slot_override Hardware slots to report (0 = discover via PAPI)
  explicit LinuxPerfBackend(uint32_t slot_override = 0);
  ~LinuxPerfBackend() override = default;

  int open_event(const perf_event_attr& attr, int pid, int cpu,
                 int* fd) override;
  void close_event(int fd) override;
  int enable(int fd) override;
  int disable(int fd) override;
  int event_id(int fd, uint64_t* id) override;
  int set_output(int fd, int target_fd) override;
  int map_ring_buffer(int fd, size_t data_pages,
                      std::unique_ptr<MappedRegion>* region) override;
  uint32_t hardware_slot_count() override;
  std::vector<int> online_cpus() override;
  int threads_of(int pid, std::vector<int>* tids) override;
  size_t page_size() const override { return page_size_; }

  /// Number of hardware counters PAPI reports for the cpu component,
  /// or 0 when PAPI cannot be initialized
  static uint32_t DiscoverHardwareSlots();

 private:
  uint32_t slot_override_;
  size_t page_size_;
};

/// ScopedEventFd closes an event descriptor through its backend
class ScopedEventFd {
 public:
  ScopedEventFd() noexcept : backend_(nullptr), fd_(-1) {}
  ScopedEventFd(EventBackend* backend, int fd) noexcept
      : backend_(backend), fd_(fd) {}
  ~ScopedEventFd() { reset(); }

  ScopedEventFd(ScopedEventFd&& other) noexcept
      : backend_(other.backend_), fd_(other.fd_) {
    other.fd_ = -1;
  }
  ScopedEventFd& operator=(ScopedEventFd&& other) noexcept {
    if (this != &other) {
      reset();
      backend_ = other.backend_;
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  ScopedEventFd(const ScopedEventFd&) = delete;
  ScopedEventFd& operator=(const ScopedEventFd&) = delete;

  int get() const noexcept { return fd_; }
  bool valid() const noexcept { return fd_ >= 0; }

  void reset() noexcept {
    if (fd_ >= 0 && backend_ != nullptr) {
      backend_->close_event(fd_);
    }
    fd_ = -1;
  }

 private:
  EventBackend* backend_;
  int fd_;
};

}  // namespace sampling
}  // namespace perfscope

#endif  // PERFSCOPE_SAMPLING_PERF_BACKEND_H_
