#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/util/key_value_metadata.h>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace fetchbox::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Resolves "file:///...", "s3://...", "gs://...", "abfs://..." or a plain
  local path into a filesystem plus the root path inside it.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& root_uri);

std::shared_ptr<const arrow::KeyValueMetadata> ToKeyValueMetadata(const std::map<std::string, std::string>& metadata);

} // namespace fetchbox::storage::common
