#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace fetchbox::retry {

enum class Phase {
  kDownload,
  kUpload,
  kSystem,
};

/*
  Failure taxonomy for one task attempt.

  Download: Timeout, Connection, Dns, HttpStatus(code), MalformedUrl, ProxyTiersExhausted
  Upload:   Network, Throttled, StorageUnavailable (5xx), AccessDenied, InvalidDestination
  System:   InternalFault, QueueCorruption
*/
enum class FailureKind {
  kTimeout,
  kConnection,
  kDns,
  kHttpStatus,
  kMalformedUrl,
  kProxyTiersExhausted,

  kNetwork,
  kThrottled,
  kStorageUnavailable,
  kAccessDenied,
  kInvalidDestination,

  kInternalFault,
  kQueueCorruption,
};

Phase PhaseOf(FailureKind kind);

// HTTP 5xx, 408 and 429 are retryable; any other status is not.
bool IsRetryable(FailureKind kind, int http_status = 0);

// Stable code persisted in dead-letter entries, e.g. "download.http_status.503".
std::string FailureCode(FailureKind kind, int http_status = 0);

std::string_view PhaseName(Phase phase);

class TaskFailure : public std::runtime_error {
 public:
  TaskFailure(FailureKind kind, const std::string& message, int http_status = 0);

  static TaskFailure FromHttpStatus(int http_status, const std::string& url);

  FailureKind Kind() const {
    return kind_;
  }

  int HttpStatus() const {
    return http_status_;
  }

  Phase GetPhase() const {
    return PhaseOf(kind_);
  }

  bool Retryable() const {
    return IsRetryable(kind_, http_status_);
  }

  std::string Code() const {
    return FailureCode(kind_, http_status_);
  }

 private:
  FailureKind kind_;
  int         http_status_;
};

/*
  Raised when shutdown cancels an in-flight attempt. Not a failure: the
  attempt is abandoned and its lease is recovered on the next start.
*/
class TaskCancelled : public std::runtime_error {
 public:
  explicit TaskCancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fetchbox::retry
