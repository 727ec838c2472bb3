#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

#include <vector>

namespace fetchbox::storage::common {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& root_uri) {
  if (root_uri.empty()) {
    return arrow::Status::Invalid("storage root_uri must not be empty");
  }

  std::string resolved_path;
  if (root_uri.front() == '/') {
    return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), root_uri);
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(root_uri, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

std::shared_ptr<const arrow::KeyValueMetadata> ToKeyValueMetadata(const std::map<std::string, std::string>& metadata) {
  std::vector<std::string> keys;
  std::vector<std::string> values;
  keys.reserve(metadata.size());
  values.reserve(metadata.size());
  for (const auto& [key, value] : metadata) {
    keys.push_back(key);
    values.push_back(value);
  }
  if (keys.empty()) {
    return {};
  }
  return std::static_pointer_cast<const arrow::KeyValueMetadata>(arrow::KeyValueMetadata::Make(std::move(keys), std::move(values)));
}

} // namespace fetchbox::storage::common
