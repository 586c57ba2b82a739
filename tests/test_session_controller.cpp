// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include <gtest/gtest.h>

#include <cerrno>
#include <map>
#include <memory>
#include <set>
#include <vector>

#include "sampling/session.h"
#include "test_support.h"

using namespace perfscope::sampling;
using namespace perfscope::test;

class SessionControllerTest : public ::testing::Test {
 protected:
  SessionControllerTest() {
    options_.buffer_pages = 4;
    options_.clock = [this]() { return now_; };
  }

  static EventDescriptor Cycles() {
    return EventDescriptor::Hardware(PERF_COUNT_HW_CPU_CYCLES)
        .set_name("cycles");
  }
  static EventDescriptor Instructions() {
    return EventDescriptor::Hardware(PERF_COUNT_HW_INSTRUCTIONS)
        .set_name("instructions");
  }
  static EventDescriptor CpuClock() {
    return EventDescriptor::Software(PERF_COUNT_SW_CPU_CLOCK)
        .set_name("cpu-clock");
  }

  size_t enabled_count() const {
    size_t count = 0;
    for (const auto& entry : backend_.events()) {
      count += entry.second.enabled ? 1 : 0;
    }
    return count;
  }

  FakeBackend backend_;
  SessionOptions options_;
  uint64_t now_ = 0;
};

TEST_F(SessionControllerTest, OpensDisabledEventsWithOneBufferPerCpu) {
  backend_.set_cpus({0, 1, 2});
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({CpuClock(), Cycles()}, &session),
            SessionResult::kSuccess);

  EXPECT_EQ(session->status(), SessionStatus::kOpened);
  EXPECT_EQ(session->event_count(), 6u);
  EXPECT_EQ(session->buffers().size(), 3u);
  EXPECT_EQ(backend_.open_count(), 6u);
  EXPECT_EQ(enabled_count(), 0u);
  EXPECT_TRUE(session->dropped_descriptors().empty());

  // The second event on each cpu writes into the first one's buffer
  std::map<int, int> owner;
  for (const auto& entry : backend_.events()) {
    const FakeBackend::Event& event = entry.second;
    EXPECT_EQ(event.attr.disabled, 1u);
    EXPECT_NE(event.attr.sample_type & PERF_SAMPLE_IDENTIFIER, 0u);
    if (owner.count(event.cpu) == 0) {
      owner[event.cpu] = entry.first;
      EXPECT_EQ(event.output, entry.first);
      EXPECT_NE(backend_.region_of(entry.first), nullptr);
    } else {
      EXPECT_EQ(event.output, owner[event.cpu]);
    }
  }
}

TEST_F(SessionControllerTest, SideBandRecordsOncePerThreadAndCpu) {
  backend_.set_cpus({0, 1});
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({CpuClock(), Cycles(), Instructions()}, &session),
            SessionResult::kSuccess);

  std::map<int, int> owners;
  for (const auto& entry : backend_.events()) {
    const perf_event_attr& attr = entry.second.attr;
    if (attr.mmap2) {
      EXPECT_EQ(attr.comm, 1u);
      EXPECT_EQ(attr.task, 1u);
      ++owners[entry.second.cpu];
    }
  }
  EXPECT_EQ(owners.size(), 2u);
  EXPECT_EQ(owners[0], 1);
  EXPECT_EQ(owners[1], 1);
}

TEST_F(SessionControllerTest, PermissionDeniedReleasesEverything) {
  backend_.set_cpus({0, 1, 2, 3});
  backend_.set_open_hook([](const perf_event_attr& attr, int, int cpu) {
    return attr.type == PERF_TYPE_HARDWARE && cpu == 2 ? EACCES : 0;
  });
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  std::vector<DroppedDescriptor> dropped;
  EXPECT_EQ(controller.open({CpuClock(), Cycles()}, &session, &dropped),
            SessionResult::kPermissionDenied);
  EXPECT_EQ(session, nullptr);
  EXPECT_GT(backend_.open_attempts(), 0u);
  EXPECT_EQ(backend_.open_count(), 0u);
  ASSERT_EQ(dropped.size(), 1u);
  EXPECT_EQ(dropped[0].name, "cycles");
  EXPECT_EQ(dropped[0].reason, SessionResult::kPermissionDenied);
}

TEST_F(SessionControllerTest, UnsupportedEventIsDroppedAlone) {
  backend_.set_open_hook([](const perf_event_attr& attr, int, int) {
    return attr.type == PERF_TYPE_HARDWARE &&
                   attr.config == PERF_COUNT_HW_INSTRUCTIONS
               ? ENOENT
               : 0;
  });
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({Cycles(), Instructions(), CpuClock()}, &session),
            SessionResult::kSuccess);
  ASSERT_EQ(session->descriptors().size(), 2u);
  EXPECT_EQ(session->descriptors()[0].name(), "cycles");
  EXPECT_EQ(session->descriptors()[1].name(), "cpu-clock");
  ASSERT_EQ(session->dropped_descriptors().size(), 1u);
  EXPECT_EQ(session->dropped_descriptors()[0].index, 1u);
  EXPECT_EQ(session->dropped_descriptors()[0].reason,
            SessionResult::kUnsupportedEvent);
  EXPECT_EQ(backend_.open_count(), 2u);
}

TEST_F(SessionControllerTest, InvalidDescriptorIsDropped) {
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  EventDescriptor zero = Cycles().set_period(0);
  ASSERT_EQ(controller.open({zero, CpuClock()}, &session),
            SessionResult::kSuccess);
  EXPECT_EQ(session->descriptors().size(), 1u);
  ASSERT_EQ(session->dropped_descriptors().size(), 1u);
  EXPECT_EQ(session->dropped_descriptors()[0].index, 0u);
}

TEST_F(SessionControllerTest, NothingOpenedIsUnsupported) {
  backend_.set_open_hook(
      [](const perf_event_attr&, int, int) { return EOPNOTSUPP; });
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  EXPECT_EQ(controller.open({Cycles()}, &session),
            SessionResult::kUnsupportedEvent);
  EXPECT_EQ(session, nullptr);
}

TEST_F(SessionControllerTest, MappingFailureIsResourceExhausted) {
  backend_.set_map_error(ENOMEM);
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  EXPECT_EQ(controller.open({CpuClock()}, &session),
            SessionResult::kResourceExhausted);
  EXPECT_EQ(backend_.open_count(), 0u);
}

TEST_F(SessionControllerTest, SetOutputFailureIsResourceExhausted) {
  backend_.set_output_error(EINVAL);
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  EXPECT_EQ(controller.open({CpuClock(), Cycles()}, &session),
            SessionResult::kResourceExhausted);
  EXPECT_EQ(backend_.open_count(), 0u);
}

TEST_F(SessionControllerTest, ThreadsAreExpandedAndVanishedOnesSkipped) {
  backend_.set_threads(77, {77, 78, 79});
  backend_.set_open_hook([](const perf_event_attr&, int pid, int) {
    return pid == 78 ? ESRCH : 0;
  });
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({CpuClock().set_pid(77)}, &session),
            SessionResult::kSuccess);
  std::set<int> pids;
  for (const auto& entry : backend_.events()) {
    pids.insert(entry.second.pid);
  }
  EXPECT_EQ(pids, (std::set<int>{77, 79}));
}

TEST_F(SessionControllerTest, MissingProcessDropsDescriptor) {
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  EXPECT_EQ(controller.open({CpuClock().set_pid(4242)}, &session),
            SessionResult::kUnsupportedEvent);
}

TEST_F(SessionControllerTest, MaxPreciseFallsBack) {
  backend_.set_open_hook([](const perf_event_attr& attr, int, int) {
    return attr.precise_ip > 1 ? EOPNOTSUPP : 0;
  });
  EventModifiers mods;
  mods.max_precise = true;
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({Cycles().set_modifiers(mods)}, &session),
            SessionResult::kSuccess);
  ASSERT_EQ(backend_.events().size(), 1u);
  EXPECT_EQ(backend_.events().begin()->second.attr.precise_ip, 1u);
}

TEST_F(SessionControllerTest, SlotsNotQueriedWithoutHardwareEvents) {
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({CpuClock()}, &session), SessionResult::kSuccess);
  EXPECT_EQ(backend_.slot_queries(), 0u);
  EXPECT_EQ(session->hardware_slots(), kFallbackHardwareSlots);
}

TEST_F(SessionControllerTest, SlotOverrideWins) {
  options_.hw_slots = 1;
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({Cycles(), Instructions()}, &session),
            SessionResult::kSuccess);
  EXPECT_EQ(backend_.slot_queries(), 0u);
  EXPECT_EQ(session->hardware_slots(), 1u);
  EXPECT_TRUE(session->schedule().needs_rotation());
}

TEST_F(SessionControllerTest, StartRotateStop) {
  backend_.set_slots(1);
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({Cycles(), Instructions(), CpuClock()}, &session),
            SessionResult::kSuccess);
  EXPECT_EQ(backend_.slot_queries(), 1u);
  EXPECT_EQ(session->rotate(), SessionResult::kInvalidState);

  ASSERT_EQ(session->start(), SessionResult::kSuccess);
  EXPECT_EQ(session->status(), SessionStatus::kRunning);
  // cycles and cpu-clock
  EXPECT_EQ(enabled_count(), 2u);

  now_ += 100;
  ASSERT_EQ(session->rotate(), SessionResult::kSuccess);
  EXPECT_EQ(enabled_count(), 2u);
  EXPECT_EQ(session->schedule().active_set(), 1u);
  now_ += 100;
  EXPECT_DOUBLE_EQ(session->enabled_fraction(0), 0.5);
  EXPECT_DOUBLE_EQ(session->scale_factor(1), 2.0);
  EXPECT_DOUBLE_EQ(session->scale_factor(2), 1.0);

  ASSERT_EQ(session->stop(), SessionResult::kSuccess);
  EXPECT_EQ(enabled_count(), 0u);
  EXPECT_EQ(session->stop(), SessionResult::kSuccess);

  session->close();
  EXPECT_EQ(session->status(), SessionStatus::kClosed);
  EXPECT_EQ(backend_.open_count(), 0u);
  EXPECT_EQ(session->start(), SessionResult::kInvalidState);
}

TEST_F(SessionControllerTest, FixedPeriod) {
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({CpuClock().set_period(250000),
                             Cycles().set_frequency(1000)},
                            &session),
            SessionResult::kSuccess);
  EXPECT_EQ(session->fixed_period(0), 250000u);
  EXPECT_EQ(session->fixed_period(1), 1u);
}

TEST_F(SessionControllerTest, FrequencyEventsCarryTheirPeriod) {
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({CpuClock().set_frequency(4000).set_fields(
                                kFieldIp | kFieldTid)},
                            &session),
            SessionResult::kSuccess);
  for (const auto& entry : backend_.events()) {
    EXPECT_NE(entry.second.attr.sample_type & PERF_SAMPLE_PERIOD, 0u);
  }
  EXPECT_NE(session->descriptors()[0].layout().sample_type & PERF_SAMPLE_PERIOD,
            0u);
}

TEST_F(SessionControllerTest, DecoderKnowsEveryIdentifier) {
  backend_.set_cpus({0, 1});
  SessionController controller(&backend_, options_);
  std::unique_ptr<Session> session;
  ASSERT_EQ(controller.open({CpuClock(), Cycles()}, &session),
            SessionResult::kSuccess);
  EXPECT_EQ(session->decoder().identifier_count(), 4u);
  for (const auto& entry : backend_.events()) {
    size_t expected = entry.second.attr.type == PERF_TYPE_HARDWARE ? 1 : 0;
    SampleSpec spec;
    spec.identifier = entry.second.id;
    std::vector<uint8_t> bytes =
        SampleEncoder(session->descriptors()[expected].layout()).encode(spec);
    const SampleDecoder::Entry* decoder_entry = nullptr;
    ASSERT_EQ(session->decoder().peek_identifier(bytes.data(), bytes.size(),
                                                 &decoder_entry),
              DecodeResult::kSuccess);
    EXPECT_EQ(decoder_entry->descriptor, expected);
  }
}

TEST(ClassifyErrnoTest, Classes) {
  EXPECT_EQ(ClassifyErrno(EACCES), SessionResult::kPermissionDenied);
  EXPECT_EQ(ClassifyErrno(EPERM), SessionResult::kPermissionDenied);
  EXPECT_EQ(ClassifyErrno(EMFILE), SessionResult::kResourceExhausted);
  EXPECT_EQ(ClassifyErrno(EBUSY), SessionResult::kResourceExhausted);
  EXPECT_EQ(ClassifyErrno(ENOENT), SessionResult::kUnsupportedEvent);
  EXPECT_EQ(ClassifyErrno(EINVAL), SessionResult::kUnsupportedEvent);
}
