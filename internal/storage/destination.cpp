#include "destination.hpp"

namespace fetchbox::storage {

namespace {

std::string TrimSlashes(const std::string& value) {
  const auto first = value.find_first_not_of('/');
  if (first == std::string::npos) return {};
  const auto last = value.find_last_not_of('/');
  return value.substr(first, last - first + 1);
}

} // namespace

Destination ResolveDestination(const fetchbox::jobs::v1::Task& task, const DestinationDefaults& defaults) {
  Destination destination;

  const auto& hint   = task.storage_hint();
  const auto  prefix = TrimSlashes(hint.key_prefix());

  if (!prefix.empty()) {
    destination.key = prefix + "/" + task.resource_id();
  } else {
    destination.key = "resources/" + task.job_type() + "/" + task.job_id() + "/" + task.resource_id();
  }

  destination.bucket = hint.bucket().empty() ? defaults.bucket : hint.bucket();

  destination.metadata = defaults.metadata;
  for (const auto& [key, value] : hint.metadata()) {
    destination.metadata[key] = value;
  }
  destination.metadata["job-id"]      = task.job_id();
  destination.metadata["resource-id"] = task.resource_id();

  return destination;
}

} // namespace fetchbox::storage
