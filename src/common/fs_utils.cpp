// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#include "common/fs_utils.h"

#include <dirent.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace perfscope {

bool ListDirectory(const std::string& path, DirFilter filter,
                   std::vector<std::string>* names) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    return false;
  }

  struct dirent* ptr;
  while ((ptr = readdir(dir)) != nullptr) {
    if (std::strcmp(ptr->d_name, ".") == 0 ||
        std::strcmp(ptr->d_name, "..") == 0) {
      continue;
    }
    bool is_dir = ptr->d_type == DT_DIR;
    if (filter == DirFilter::kDirectories && !is_dir) continue;
    if (filter == DirFilter::kFiles && is_dir) continue;
    names->push_back(ptr->d_name);
  }
  closedir(dir);
  return true;
}

bool ReadFileToString(const std::string& path, std::string* content) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  *content = ss.str();
  return true;
}

bool ReadUint64File(const std::string& path, uint64_t* value) {
  std::string content;
  if (!ReadFileToString(path, &content)) {
    return false;
  }
  while (!content.empty() &&
         (content.back() == '\n' || content.back() == ' ')) {
    content.pop_back();
  }
  return ParseUint64(content, 10, value);
}

void Split(const std::string& str, const char* delim,
           std::vector<std::string>* res) {
  size_t start = 0;
  while (start <= str.size()) {
    size_t end = str.find_first_of(delim, start);
    if (end == std::string::npos) {
      end = str.size();
    }
    if (end > start) {
      res->push_back(str.substr(start, end - start));
    }
    start = end + 1;
  }
}

bool ParseUint64(const std::string& text, int base, uint64_t* value) {
  if (text.empty() || text[0] == '-' || text[0] == '+') {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long parsed = std::strtoull(text.c_str(), &end, base);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    return false;
  }
  *value = static_cast<uint64_t>(parsed);
  return true;
}

bool ParseCpuList(const std::string& text, std::vector<int>* cpus) {
  std::vector<std::string> ranges;
  Split(text, ",\n ", &ranges);
  for (const auto& range : ranges) {
    uint64_t first = 0;
    uint64_t last = 0;
    size_t dash = range.find('-');
    if (dash == std::string::npos) {
      if (!ParseUint64(range, 10, &first)) return false;
      last = first;
    } else {
      if (!ParseUint64(range.substr(0, dash), 10, &first) ||
          !ParseUint64(range.substr(dash + 1), 10, &last) || last < first) {
        return false;
      }
    }
    for (uint64_t cpu = first; cpu <= last; ++cpu) {
      cpus->push_back(static_cast<int>(cpu));
    }
  }
  return !cpus->empty();
}

}  // namespace perfscope
