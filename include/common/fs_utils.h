// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_COMMON_FS_UTILS_H_
#define PERFSCOPE_COMMON_FS_UTILS_H_

#include <cstdint>
#include <string>
#include <vector>

namespace perfscope {

/// Entry kinds accepted by ListDirectory
enum class DirFilter { kAll, kDirectories, kFiles };

/// List the entry names of a directory (without "." and "..")
/// @return false if the directory cannot be opened
bool ListDirectory(const std::string& path, DirFilter filter,
                   std::vector<std::string>* names);

/// Read a whole (small) file such as a procfs or sysfs entry
bool ReadFileToString(const std::string& path, std::string* content);

/// Read a file holding one decimal integer (tracefs ids, sysctl values)
bool ReadUint64File(const std::string& path, uint64_t* value);

/// Split on any of the delimiter characters, dropping empty tokens
void Split(const std::string& str, const char* delim,
           std::vector<std::string>* res);

/// Parse an unsigned integer in the given base, rejecting trailing garbage
bool ParseUint64(const std::string& text, int base, uint64_t* value);

/// Parse a CPU list such as "0-3,8,10-11" (sysfs online/possible format)
bool ParseCpuList(const std::string& text, std::vector<int>* cpus);

}  // namespace perfscope

#endif  // PERFSCOPE_COMMON_FS_UTILS_H_
