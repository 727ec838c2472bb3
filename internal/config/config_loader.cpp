#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace fetchbox::config {

namespace {

using fetchbox::runtime::config::RuntimeConfig;
using google::protobuf::Value;

std::string Where(const YAML::Node& node, const std::string& path) {
  const auto mark = node.Mark();
  std::string where = path.empty() ? "<root>" : path;
  if (!mark.is_null()) where += " (line " + std::to_string(mark.line + 1) + ")";
  return where;
}

void ConvertScalar(const YAML::Node& node, Value* out) {
  const std::string& text = node.Scalar();

  // "8080" and 'true' were quoted on purpose
  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  if (!text.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0' && std::isfinite(number)) {
      out->set_number_value(number);
      return;
    }
  }

  out->set_string_value(text);
}

void Convert(const YAML::Node& node, const std::string& path, Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ConvertScalar(node, out);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = out->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        Convert(node[i], path + "[" + std::to_string(i) + "]", list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = out->mutable_struct_value()->mutable_fields();
      for (const auto& item : node) {
        if (!item.first.IsScalar()) {
          throw std::runtime_error("Invalid configuration: non-scalar key at " + Where(item.first, path));
        }
        const auto& key = item.first.Scalar();
        Convert(item.second, path.empty() ? key : path + "." + key, &(*fields)[key]);
      }
      return;
    }

    default:
      throw std::runtime_error("Invalid configuration: unsupported YAML node at " + Where(node, path));
  }
}

RuntimeConfig ToRuntimeConfig(const YAML::Node& document) {
  Value root;
  if (document.IsNull()) {
    root.mutable_struct_value();
  } else if (!document.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  } else {
    Convert(document, "", &root);
  }

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(root, &json); !status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  RuntimeConfig config;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config '" + path + "': " + e.what());
  }
  return ToRuntimeConfig(document);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ToRuntimeConfig(document);
}

} // namespace fetchbox::config
