#include "storage_factory.hpp"

#include "arrow_object_sink.hpp"
#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace fetchbox::storage {

using namespace fetchbox::storage::common;

std::shared_ptr<ObjectSink> BuildObjectSink(const fetchbox::runtime::config::StorageConfig& config) {
  auto [fs, root_path] = Unwrap(ResolveFileSystem(config.root_uri()));

  FETCHBOX_LOG_INFO("Object storage ready", {observability::StringField("root_uri", config.root_uri()),
                                             observability::StringField("filesystem", fs->type_name()),
                                             observability::BoolField("checksum", config.checksum())});

  return std::make_shared<ArrowObjectSink>(std::move(fs), std::move(root_path), config.checksum());
}

} // namespace fetchbox::storage
