#include "failure.hpp"

namespace fetchbox::retry {

Phase PhaseOf(FailureKind kind) {
  switch (kind) {
    case FailureKind::kTimeout:
    case FailureKind::kConnection:
    case FailureKind::kDns:
    case FailureKind::kHttpStatus:
    case FailureKind::kMalformedUrl:
    case FailureKind::kProxyTiersExhausted:
      return Phase::kDownload;
    case FailureKind::kNetwork:
    case FailureKind::kThrottled:
    case FailureKind::kStorageUnavailable:
    case FailureKind::kAccessDenied:
    case FailureKind::kInvalidDestination:
      return Phase::kUpload;
    case FailureKind::kInternalFault:
    case FailureKind::kQueueCorruption:
      return Phase::kSystem;
  }
  return Phase::kSystem;
}

bool IsRetryable(FailureKind kind, int http_status) {
  switch (kind) {
    case FailureKind::kTimeout:
    case FailureKind::kConnection:
    case FailureKind::kDns:
    case FailureKind::kNetwork:
    case FailureKind::kThrottled:
    case FailureKind::kStorageUnavailable:
      return true;
    case FailureKind::kHttpStatus:
      return http_status >= 500 || http_status == 408 || http_status == 429;
    case FailureKind::kMalformedUrl:
    case FailureKind::kProxyTiersExhausted:
    case FailureKind::kAccessDenied:
    case FailureKind::kInvalidDestination:
    case FailureKind::kInternalFault:
    case FailureKind::kQueueCorruption:
      return false;
  }
  return false;
}

std::string FailureCode(FailureKind kind, int http_status) {
  switch (kind) {
    case FailureKind::kTimeout:
      return "download.timeout";
    case FailureKind::kConnection:
      return "download.connection";
    case FailureKind::kDns:
      return "download.dns";
    case FailureKind::kHttpStatus:
      return "download.http_status." + std::to_string(http_status);
    case FailureKind::kMalformedUrl:
      return "download.malformed_url";
    case FailureKind::kProxyTiersExhausted:
      return "download.proxy_tiers_exhausted";
    case FailureKind::kNetwork:
      return "upload.network";
    case FailureKind::kThrottled:
      return "upload.throttled";
    case FailureKind::kStorageUnavailable:
      return "upload.unavailable";
    case FailureKind::kAccessDenied:
      return "upload.access_denied";
    case FailureKind::kInvalidDestination:
      return "upload.invalid_destination";
    case FailureKind::kInternalFault:
      return "system.internal_fault";
    case FailureKind::kQueueCorruption:
      return "system.queue_corruption";
  }
  return "system.internal_fault";
}

std::string_view PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kDownload:
      return "download";
    case Phase::kUpload:
      return "upload";
    case Phase::kSystem:
      return "system";
  }
  return "system";
}

TaskFailure::TaskFailure(FailureKind kind, const std::string& message, int http_status)
    : std::runtime_error(message), kind_(kind), http_status_(http_status) {
}

TaskFailure TaskFailure::FromHttpStatus(int http_status, const std::string& url) {
  return TaskFailure(FailureKind::kHttpStatus, "HTTP " + std::to_string(http_status) + " from " + url, http_status);
}

} // namespace fetchbox::retry
