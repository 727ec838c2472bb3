#pragma once

#include <string>

#include "config/config.pb.h"

namespace fetchbox::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static fetchbox::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for an in-memory document (used by tests and --check).
  static fetchbox::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace fetchbox::config
