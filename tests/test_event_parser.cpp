// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>

#include "sampling/event_catalog.h"
#include "sampling/event_parser.h"

using namespace perfscope::sampling;

class EventParserTest : public ::testing::Test {
 protected:
  void SetUp() override {
    char tmpl[] = "/tmp/perfscope_tracefs_XXXXXX";
    char* dir = mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    root_ = dir;
    add_tracepoint("sched", "sched_switch", 317);
    add_tracepoint("sched", "sched_wakeup", 318);
    add_tracepoint("irq", "irq_handler_entry", 120);
    catalog_.reset(new EventCatalog(root_));
    parser_.reset(new EventParser(catalog_.get()));
  }

  void TearDown() override {
    std::string cmd = "rm -rf " + root_;
    if (std::system(cmd.c_str()) != 0) {
      std::fprintf(stderr, "cannot remove %s\n", root_.c_str());
    }
  }

  void add_tracepoint(const std::string& category, const std::string& name,
                      uint64_t id) {
    mkdir((root_ + "/events").c_str(), 0755);
    mkdir((root_ + "/events/" + category).c_str(), 0755);
    std::string dir = root_ + "/events/" + category + "/" + name;
    mkdir(dir.c_str(), 0755);
    std::ofstream(dir + "/id") << id << "\n";
  }

  std::string root_;
  std::unique_ptr<EventCatalog> catalog_;
  std::unique_ptr<EventParser> parser_;
};

TEST_F(EventParserTest, SymbolicEventsAndAliases) {
  EventDescriptor desc;
  ASSERT_EQ(parser_->parse("cycles", &desc), ParseResult::kSuccess);
  EXPECT_EQ(desc.kind(), EventKind::kHardware);
  EXPECT_EQ(desc.config(), static_cast<uint64_t>(PERF_COUNT_HW_CPU_CYCLES));
  EXPECT_EQ(desc.name(), "cycles");

  ASSERT_EQ(parser_->parse("cs", &desc), ParseResult::kSuccess);
  EXPECT_EQ(desc.kind(), EventKind::kSoftware);
  EXPECT_EQ(desc.config(),
            static_cast<uint64_t>(PERF_COUNT_SW_CONTEXT_SWITCHES));

  ASSERT_EQ(parser_->parse("task-clock", &desc), ParseResult::kSuccess);
  EXPECT_EQ(desc.config(), static_cast<uint64_t>(PERF_COUNT_SW_TASK_CLOCK));
}

TEST_F(EventParserTest, ModifiersOnSymbolicEvent) {
  EventDescriptor desc;
  ASSERT_EQ(parser_->parse("instructions:upp", &desc), ParseResult::kSuccess);
  EXPECT_FALSE(desc.modifiers().exclude_user);
  EXPECT_TRUE(desc.modifiers().exclude_kernel);
  EXPECT_TRUE(desc.modifiers().exclude_hv);
  EXPECT_EQ(desc.modifiers().precise_ip, 2);
  EXPECT_EQ(desc.name(), "instructions:upp");
}

TEST_F(EventParserTest, SampleReadModifierAddsField) {
  EventDescriptor desc;
  ASSERT_EQ(parser_->parse("cycles:S", &desc), ParseResult::kSuccess);
  EXPECT_TRUE(desc.has_field(kFieldRead));
}

TEST_F(EventParserTest, Tracepoints) {
  EventDescriptor desc;
  ASSERT_EQ(parser_->parse("sched:sched_switch", &desc),
            ParseResult::kSuccess);
  EXPECT_EQ(desc.kind(), EventKind::kTracepoint);
  EXPECT_EQ(desc.config(), 317u);

  ASSERT_EQ(parser_->parse("irq:irq_handler_entry:k", &desc),
            ParseResult::kSuccess);
  EXPECT_EQ(desc.config(), 120u);
  EXPECT_TRUE(desc.modifiers().exclude_user);

  EXPECT_EQ(parser_->parse("sched:no_such_event", &desc),
            ParseResult::kUnknownTracepoint);
}

TEST_F(EventParserTest, RawEvents) {
  EventDescriptor desc;
  ASSERT_EQ(parser_->parse("r1a8", &desc), ParseResult::kSuccess);
  EXPECT_EQ(desc.kind(), EventKind::kRaw);
  EXPECT_EQ(desc.config(), 0x1a8u);

  ASSERT_EQ(parser_->parse("r0xc0:u", &desc), ParseResult::kSuccess);
  EXPECT_EQ(desc.config(), 0xc0u);
  EXPECT_TRUE(desc.modifiers().exclude_kernel);
}

TEST_F(EventParserTest, Errors) {
  EventDescriptor desc;
  EXPECT_EQ(parser_->parse("", &desc), ParseResult::kEmpty);
  EXPECT_EQ(parser_->parse("not-an-event", &desc), ParseResult::kUnknownEvent);
  EXPECT_EQ(parser_->parse("cycles::u", &desc), ParseResult::kSyntaxError);
  EXPECT_EQ(parser_->parse("a:b:c:d", &desc), ParseResult::kSyntaxError);
  EXPECT_EQ(parser_->parse("cycles:x", &desc), ParseResult::kInvalidModifier);
  EXPECT_EQ(parser_->parse("cycles:pppp", &desc),
            ParseResult::kInvalidModifier);
  EXPECT_EQ(parser_->parse("cycles:b", &desc),
            ParseResult::kUnsupportedModifier);
}

TEST_F(EventParserTest, ModifierRules) {
  EventModifiers mods;
  bool read = false;
  ASSERT_EQ(EventParser::ParseModifiers("GI", &mods, &read),
            ParseResult::kSuccess);
  EXPECT_TRUE(mods.exclude_idle);
  EXPECT_FALSE(mods.exclude_guest);
  EXPECT_TRUE(mods.exclude_host);
  EXPECT_FALSE(mods.exclude_user);

  ASSERT_EQ(EventParser::ParseModifiers("PDWe", &mods, &read),
            ParseResult::kSuccess);
  EXPECT_TRUE(mods.max_precise);
  EXPECT_TRUE(mods.pinned);
  EXPECT_TRUE(mods.weak_group);
  EXPECT_TRUE(mods.exclusive);

  EXPECT_EQ(EventParser::ParseModifiers(std::string(17, 'u'), &mods, &read),
            ParseResult::kInvalidModifier);
}

TEST_F(EventParserTest, ParseList) {
  std::vector<EventDescriptor> descs;
  std::string failed;
  ASSERT_EQ(parser_->parse_list("cycles, sched:sched_wakeup,cpu-clock", &descs,
                                &failed),
            ParseResult::kSuccess);
  ASSERT_EQ(descs.size(), 3u);
  EXPECT_EQ(descs[1].config(), 318u);

  descs.clear();
  EXPECT_EQ(parser_->parse_list("cycles,bogus", &descs, &failed),
            ParseResult::kUnknownEvent);
  EXPECT_EQ(failed, "bogus");
  EXPECT_TRUE(descs.empty());
}

TEST_F(EventParserTest, CatalogListsTracepointsSorted) {
  std::vector<TracepointInfo> tps = catalog_->tracepoints();
  ASSERT_EQ(tps.size(), 3u);
  EXPECT_EQ(tps[0].full_name(), "irq:irq_handler_entry");
  EXPECT_EQ(tps[1].full_name(), "sched:sched_switch");
  EXPECT_EQ(tps[2].full_name(), "sched:sched_wakeup");

  uint64_t id = 0;
  EXPECT_FALSE(catalog_->tracepoint_id("sched", "../sched/sched_switch", &id));
}

TEST_F(EventParserTest, CatalogSymbolicNames) {
  std::vector<std::string> names = EventCatalog::SymbolicNames();
  EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
  const SymbolicEventInfo* info = EventCatalog::FindSymbolic("branches");
  ASSERT_NE(info, nullptr);
  EXPECT_EQ(info->config,
            static_cast<uint64_t>(PERF_COUNT_HW_BRANCH_INSTRUCTIONS));
  EXPECT_EQ(EventCatalog::FindSymbolic("nonsense"), nullptr);
}
