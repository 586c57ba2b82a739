// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include <gtest/gtest.h>

#include "analysis/elf_image.h"
#include "analysis/process_maps.h"
#include "analysis/symbol_resolver.h"
#include <unistd.h>

#include <memory>
#include <string>
#include <variant>

using namespace perfscope::analysis;

extern "C" __attribute__((noinline)) int perfscope_resolver_target(int x) {
  return x * 7 + 3;
}

namespace sample_ns {
__attribute__((noinline)) int ScaledValue(int x, double factor) {
  return static_cast<int>(x * factor);
}
}  // namespace sample_ns

class SymbolResolverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Get path to current executable for testing
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
      buf[len] = '\0';
      test_binary_ = std::string(buf);
    }
    ASSERT_TRUE(maps_.parse_process(0));
  }

  static uint64_t AddressOf(int (*fn)(int)) {
    return reinterpret_cast<uint64_t>(fn);
  }

  std::string test_binary_;
  ProcessMaps maps_;
};

TEST_F(SymbolResolverTest, Demangle) {
  EXPECT_EQ(Demangle("_ZN9sample_ns11ScaledValueEid"),
            "sample_ns::ScaledValue(int, double)");
  EXPECT_EQ(Demangle("main"), "main");
  EXPECT_EQ(Demangle("_Z$$bad"), "_Z$$bad");
}

TEST_F(SymbolResolverTest, ElfImageOfTestBinary) {
  ASSERT_FALSE(test_binary_.empty());
  auto image = ElfImage::Open(test_binary_);
  ASSERT_NE(image, nullptr);
  EXPECT_FALSE(image->segments().empty());
  EXPECT_GT(image->symbol_count(), 0u);

  EhFrameHeader header;
  EXPECT_TRUE(image->eh_frame_header(&header));
  EXPECT_GT(header.size, 0u);

  // Offsets and addresses map back and forth through the same segment
  uint64_t offset = 0;
  uint64_t vaddr = 0;
  const ElfSegment& first = image->segments().front();
  ASSERT_TRUE(image->file_offset_to_vaddr(first.offset, &vaddr));
  EXPECT_EQ(vaddr, first.vaddr);
  ASSERT_TRUE(image->vaddr_to_file_offset(vaddr, &offset));
  EXPECT_EQ(offset, first.offset);

  uint32_t magic = 0;
  ASSERT_TRUE(image->read(0, &magic, sizeof(magic)));
  EXPECT_EQ(magic, 0x464c457fu);
}

TEST_F(SymbolResolverTest, OpenRejectsNonElf) {
  EXPECT_EQ(ElfImage::Open("/nonexistent"), nullptr);
  EXPECT_EQ(ElfImage::Open("/proc/self/maps"), nullptr);
  EXPECT_EQ(ElfImage::Open("/"), nullptr);
}

TEST_F(SymbolResolverTest, ResolvesFunctionInThisBinary) {
  uint64_t address = AddressOf(perfscope_resolver_target) + 2;
  const Mapping* mapping = maps_.find(address);
  ASSERT_NE(mapping, nullptr);
  ASSERT_TRUE(mapping->is_file());

  SymbolResolver resolver;
  FrameSymbol symbol = resolver.resolve(mapping, address, false);
  ASSERT_TRUE(std::holds_alternative<ResolvedSymbol>(symbol));
  const ResolvedSymbol& resolved = std::get<ResolvedSymbol>(symbol);
  EXPECT_EQ(resolved.name, "perfscope_resolver_target");
  EXPECT_EQ(resolved.offset, 2u);
  EXPECT_EQ(*resolved.module, *mapping->path);
}

TEST_F(SymbolResolverTest, ResolvesAndDemanglesCxxFunction) {
  uint64_t address =
      reinterpret_cast<uint64_t>(&sample_ns::ScaledValue);
  const Mapping* mapping = maps_.find(address);
  ASSERT_NE(mapping, nullptr);

  SymbolResolver resolver;
  CallFrame frame(address, resolver.resolve(mapping, address, false));
  ASSERT_TRUE(frame.resolved());
  EXPECT_EQ(frame.name(), "sample_ns::ScaledValue(int, double)");
}

TEST_F(SymbolResolverTest, ReturnAddressLooksUpPreviousByte) {
  // A return address right after the last byte of a function belongs to it
  uint64_t start = AddressOf(perfscope_resolver_target);
  const Mapping* mapping = maps_.find(start);
  ASSERT_NE(mapping, nullptr);
  SymbolResolver resolver;
  FrameSymbol symbol = resolver.resolve(mapping, start + 1, true);
  ASSERT_TRUE(std::holds_alternative<ResolvedSymbol>(symbol));
  EXPECT_EQ(std::get<ResolvedSymbol>(symbol).offset, 1u);
  EXPECT_EQ(std::get<ResolvedSymbol>(symbol).name,
            "perfscope_resolver_target");
}

TEST_F(SymbolResolverTest, UnresolvedFrames) {
  SymbolResolver resolver;
  FrameSymbol none = resolver.resolve(nullptr, 0x1234, false);
  ASSERT_TRUE(std::holds_alternative<UnresolvedSymbol>(none));
  EXPECT_EQ(std::get<UnresolvedSymbol>(none).address, 0x1234u);
  EXPECT_FALSE(std::get<UnresolvedSymbol>(none).module);

  int local = 0;
  uint64_t stack_address = reinterpret_cast<uint64_t>(&local);
  const Mapping* stack = maps_.find(stack_address);
  ASSERT_NE(stack, nullptr);
  FrameSymbol anon = resolver.resolve(stack, stack_address, false);
  ASSERT_TRUE(std::holds_alternative<UnresolvedSymbol>(anon));
  EXPECT_EQ(std::get<UnresolvedSymbol>(anon).offset,
            stack->file_offset(stack_address));

  Mapping missing;
  missing.start = 0x400000;
  missing.end = 0x500000;
  missing.executable = true;
  missing.path = std::make_shared<const std::string>("/nonexistent/lib.so");
  FrameSymbol gone = resolver.resolve(&missing, 0x401000, false);
  ASSERT_TRUE(std::holds_alternative<UnresolvedSymbol>(gone));
  EXPECT_EQ(*std::get<UnresolvedSymbol>(gone).module, "/nonexistent/lib.so");
  EXPECT_EQ(std::get<UnresolvedSymbol>(gone).offset, 0x1000u);
}

TEST_F(SymbolResolverTest, CacheStatistics) {
  uint64_t address = AddressOf(perfscope_resolver_target);
  const Mapping* mapping = maps_.find(address);
  ASSERT_NE(mapping, nullptr);

  SymbolResolver resolver(true);
  resolver.resolve(mapping, address, false);
  resolver.resolve(mapping, address, false);
  SymbolResolver::CacheStats stats = resolver.get_cache_stats();
  EXPECT_EQ(stats.misses, 1u);
  EXPECT_EQ(stats.hits, 1u);
  EXPECT_EQ(stats.size, 1u);

  resolver.clear_cache();
  stats = resolver.get_cache_stats();
  EXPECT_EQ(stats.size, 0u);
  EXPECT_EQ(stats.hits, 0u);

  SymbolResolver uncached(false);
  uncached.resolve(mapping, address, false);
  EXPECT_EQ(uncached.get_cache_stats().size, 0u);
}
