#pragma once

#include <string>

#include "internal/retry/failure.hpp"

namespace fetchbox::storage::common {

/*
  Object keys are relative '/' separated paths. Empty segments, "." and
  ".." are rejected so a key can never escape its bucket.
*/
inline void ValidateObjectKey(const std::string& key) {
  using retry::FailureKind;
  using retry::TaskFailure;

  if (key.empty()) {
    throw TaskFailure(FailureKind::kInvalidDestination, "object key must not be empty");
  }

  size_t start = 0;
  while (start <= key.size()) {
    const size_t end     = key.find('/', start);
    const auto   segment = key.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      throw TaskFailure(FailureKind::kInvalidDestination, "object key '" + key + "' contains an invalid path segment");
    }
    if (segment.find('\0') != std::string::npos || segment.find('\\') != std::string::npos) {
      throw TaskFailure(FailureKind::kInvalidDestination, "object key '" + key + "' contains invalid character");
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
}

inline void ValidateBucket(const std::string& bucket) {
  if (bucket.empty() || bucket.find('/') != std::string::npos || bucket == "." || bucket == "..") {
    throw retry::TaskFailure(retry::FailureKind::kInvalidDestination, "invalid bucket '" + bucket + "'");
  }
}

inline std::string JoinPath(const std::string& root, const std::string& relative) {
  if (root.empty()) return relative;
  if (root.back() == '/') return root + relative;
  return root + "/" + relative;
}

} // namespace fetchbox::storage::common
