#pragma once

#include <stdexcept>
#include <string>

namespace fetchbox::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Entry is not leased by the caller (stale lease after recovery or a guard violation).
class LeaseConflict : public std::runtime_error {
 public:
  explicit LeaseConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backpressure signal to ingress: active entries reached configured capacity.
class QueueFull : public std::runtime_error {
 public:
  explicit QueueFull(const std::string& msg) : std::runtime_error(msg) {
  }
};

class QueueCorruption : public std::runtime_error {
 public:
  explicit QueueCorruption(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProxyPoolNotFound : public std::runtime_error {
 public:
  explicit ProxyPoolNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage/database layer failed in a way callers cannot recover from.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fetchbox::util
