#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ingest::storage::common {

inline void ValidateKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("object key must not be empty");
  }
  if (key.front() == '/') {
    throw std::invalid_argument("object key must be relative: " + key);
  }

  size_t start = 0;
  while (start <= key.size()) {
    auto end = key.find('/', start);
    if (end == std::string::npos) end = key.size();
    const std::string_view segment(key.data() + start, end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      throw std::invalid_argument("object key contains an invalid path segment: " + key);
    }
    if (segment.find('\\') != std::string_view::npos || segment.find('\0') != std::string_view::npos) {
      throw std::invalid_argument("object key contains invalid character: " + key);
    }
    start = end + 1;
  }
}

inline std::string JoinKey(const std::string& prefix, const std::string& name) {
  if (prefix.empty()) return name;
  if (prefix.back() == '/') return prefix + name;
  return prefix + "/" + name;
}

/*
  Object path layout:

      <root>/<key>
*/
inline std::string ObjectPath(const std::string& root, const std::string& key) {
  ValidateKey(key);
  return JoinKey(root, key);
}

} // namespace ingest::storage::common
