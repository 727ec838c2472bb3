#pragma once

#include <memory>

#include "object_sink.hpp"

namespace fetchbox::runtime::config {
class StorageConfig;
}

namespace fetchbox::storage {

std::shared_ptr<ObjectSink> BuildObjectSink(const fetchbox::runtime::config::StorageConfig& config);

} // namespace fetchbox::storage
