// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "common/fs_utils.h"

using namespace perfscope;

TEST(FsUtilsTest, Split) {
  std::vector<std::string> parts;
  Split("a, b,,c ", ", ", &parts);
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[1], "b");
  EXPECT_EQ(parts[2], "c");
}

TEST(FsUtilsTest, ParseUint64) {
  uint64_t value = 0;
  EXPECT_TRUE(ParseUint64("18446744073709551615", 10, &value));
  EXPECT_EQ(value, UINT64_MAX);
  EXPECT_TRUE(ParseUint64("1a8", 16, &value));
  EXPECT_EQ(value, 0x1a8u);
  EXPECT_FALSE(ParseUint64("18446744073709551616", 10, &value));
  EXPECT_FALSE(ParseUint64("-1", 10, &value));
  EXPECT_FALSE(ParseUint64("12x", 10, &value));
  EXPECT_FALSE(ParseUint64("", 10, &value));
}

TEST(FsUtilsTest, ParseCpuList) {
  std::vector<int> cpus;
  ASSERT_TRUE(ParseCpuList("0-3,8,10-11\n", &cpus));
  EXPECT_EQ(cpus, (std::vector<int>{0, 1, 2, 3, 8, 10, 11}));

  cpus.clear();
  EXPECT_FALSE(ParseCpuList("3-1", &cpus));
  cpus.clear();
  EXPECT_FALSE(ParseCpuList("", &cpus));
}

TEST(FsUtilsTest, ReadUint64File) {
  char path[] = "/tmp/perfscope_id_XXXXXX";
  int fd = mkstemp(path);
  ASSERT_GE(fd, 0);
  close(fd);
  std::ofstream(path) << "317\n";

  uint64_t id = 0;
  EXPECT_TRUE(ReadUint64File(path, &id));
  EXPECT_EQ(id, 317u);
  std::remove(path);
  EXPECT_FALSE(ReadUint64File(path, &id));
}

TEST(FsUtilsTest, ListDirectory) {
  std::vector<std::string> names;
  ASSERT_TRUE(ListDirectory("/proc/self", DirFilter::kDirectories, &names));
  bool has_fd = false;
  for (const auto& name : names) {
    EXPECT_NE(name, ".");
    EXPECT_NE(name, "..");
    has_fd |= name == "fd";
  }
  EXPECT_TRUE(has_fd);
  EXPECT_FALSE(ListDirectory("/nonexistent", DirFilter::kAll, &names));
}
