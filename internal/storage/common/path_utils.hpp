#pragma once

#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace stagegraph::storage::common {

/*
  Splits a store path into segments, dropping empty and "." segments.
  ".." is rejected so a path can never leave the store root.
*/
inline std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::string              current;
  auto flush = [&]() {
    if (current == "..") {
      throw util::StoreError("store path must not contain '..': " + path);
    }
    if (!current.empty() && current != ".") {
      segments.push_back(current);
    }
    current.clear();
  };

  for (char c : path) {
    if (c == '\0') {
      throw util::StoreError("store path contains a NUL byte");
    }
    if (c == '/') {
      flush();
    } else {
      current.push_back(c);
    }
  }
  flush();
  return segments;
}

inline std::string NormalizePath(const std::string& path) {
  std::string out;
  for (const auto& segment : SplitPath(path)) {
    if (!out.empty()) out.push_back('/');
    out += segment;
  }
  return out;
}

// "" for top-level entries.
inline std::string ParentOf(const std::string& normalized) {
  const auto slash = normalized.rfind('/');
  return slash == std::string::npos ? std::string{} : normalized.substr(0, slash);
}

} // namespace stagegraph::storage::common
