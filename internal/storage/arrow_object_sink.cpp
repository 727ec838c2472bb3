#include "arrow_object_sink.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/util/io_util.h>

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <vector>

#include "checksum.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retry/failure.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace fetchbox::storage {

using namespace fetchbox::storage::common;
using retry::FailureKind;
using retry::TaskFailure;

namespace {

constexpr size_t kChunkSize = 64 * 1024;

// Errors of filesystems backed by the local OS carry errno in their detail.
std::optional<FailureKind> FromErrno(int errnum) {
  switch (errnum) {
    case 0:
      return std::nullopt;
    case EACCES:
    case EPERM:
    case EROFS:
      return FailureKind::kAccessDenied;
    case ENOTDIR:
    case EISDIR:
    case EEXIST:
    case ENAMETOOLONG:
    case EINVAL:
      return FailureKind::kInvalidDestination;
    case ENOSPC:
    case EDQUOT:
    case EIO:
      return FailureKind::kStorageUnavailable;
    default:
      return FailureKind::kNetwork;
  }
}

/*
  S3 errors carry no typed detail. Arrow renders them as
  "...: AWS Error <NAME> during <Op> operation: ..." or, for an
  unmapped error, "AWS Error UNKNOWN (HTTP status <code>) during ...".
  Only the text after the last marker is inspected, so bucket and key
  names earlier in the message never influence the result.
*/
std::optional<FailureKind> FromAwsError(const std::string& message) {
  static constexpr std::string_view kMarker = "AWS Error ";
  const auto at = message.rfind(kMarker);
  if (at == std::string::npos) return std::nullopt;

  const std::string_view rest(message.data() + at + kMarker.size(), message.size() - at - kMarker.size());
  const std::string_view name = rest.substr(0, rest.find(' '));

  if (name == "ACCESS_DENIED" || name == "INVALID_ACCESS_KEY_ID" || name == "SIGNATURE_DOES_NOT_MATCH" || name == "MISSING_AUTHENTICATION_TOKEN") {
    return FailureKind::kAccessDenied;
  }
  if (name == "SLOW_DOWN" || name == "THROTTLING" || name == "REQUEST_LIMIT_EXCEEDED") {
    return FailureKind::kThrottled;
  }
  if (name == "SERVICE_UNAVAILABLE" || name == "INTERNAL_FAILURE") {
    return FailureKind::kStorageUnavailable;
  }
  if (name == "NO_SUCH_BUCKET" || name == "INVALID_PARAMETER_VALUE") {
    return FailureKind::kInvalidDestination;
  }

  static constexpr std::string_view kHttp = "(HTTP status ";
  if (const auto http = rest.find(kHttp); http != std::string_view::npos && http < rest.find(" during ")) {
    const int code = std::atoi(std::string(rest.substr(http + kHttp.size(), 3)).c_str());
    if (code == 401 || code == 403) return FailureKind::kAccessDenied;
    if (code == 429 || code == 503) return FailureKind::kThrottled;
    if (code >= 500) return FailureKind::kStorageUnavailable;
    if (code == 400 || code == 404) return FailureKind::kInvalidDestination;
  }
  return std::nullopt;
}

void Check(const arrow::Status& status, const std::string& path) {
  if (!status.ok()) ThrowUploadFailure(status, path);
}

template <typename T>
T Check(arrow::Result<T> result, const std::string& path) {
  if (!result.ok()) ThrowUploadFailure(result.status(), path);
  return std::move(result).ValueOrDie();
}

} // namespace

void ThrowUploadFailure(const arrow::Status& status, const std::string& path) {
  const auto message = path + ": " + status.ToString();

  if (auto kind = FromErrno(arrow::internal::ErrnoFromStatus(status))) throw TaskFailure(*kind, message);

  if (status.IsInvalid() || status.IsKeyError() || status.IsNotImplemented()) {
    throw TaskFailure(FailureKind::kInvalidDestination, message);
  }
  if (status.IsOutOfMemory() || status.IsCapacityError()) {
    throw TaskFailure(FailureKind::kStorageUnavailable, message);
  }
  if (auto kind = FromAwsError(status.message())) throw TaskFailure(*kind, message);

  throw TaskFailure(FailureKind::kNetwork, message);
}

ArrowObjectSink::ArrowObjectSink(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, bool checksum)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), checksum_(checksum) {
}

std::string ArrowObjectSink::ObjectPath(const Destination& destination) const {
  ValidateBucket(destination.bucket);
  ValidateObjectKey(destination.key);
  return JoinPath(root_path_, destination.bucket + "/" + destination.key);
}

UploadedRef ArrowObjectSink::Upload(download::ByteStream& body, const Destination& destination) {
  const auto path = ObjectPath(destination);

  const auto parent = path.substr(0, path.find_last_of('/'));
  Check(fs_->CreateDir(parent, /*recursive=*/true), path);

  auto out = Check(fs_->OpenOutputStream(path, ToKeyValueMetadata(destination.metadata)), path);

  std::optional<Sha256> digest;
  if (checksum_) digest.emplace();

  UploadedRef ref;
  ref.bucket = destination.bucket;
  ref.key    = destination.key;

  try {
    std::vector<char> buffer(kChunkSize);
    for (;;) {
      const size_t n = body.Read(buffer.data(), buffer.size());
      if (n == 0) break;

      Check(out->Write(buffer.data(), static_cast<int64_t>(n)), path);
      if (digest) digest->Update(buffer.data(), n);
      ref.bytes += n;
    }
    Check(out->Close(), path);
  } catch (...) {
    if (auto st = out->Abort(); !st.ok()) {
      FETCHBOX_LOG_WARN("Abort of partial upload failed", {observability::StringField("path", path), observability::StringField("error", st.ToString())});
    }
    if (auto st = fs_->DeleteFile(path); !st.ok() && !st.IsIOError()) {
      FETCHBOX_LOG_WARN("Cleanup of partial object failed", {observability::StringField("path", path), observability::StringField("error", st.ToString())});
    }
    throw;
  }

  if (digest) ref.checksum = digest->HexDigest();
  return ref;
}

} // namespace fetchbox::storage
