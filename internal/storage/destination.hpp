#pragma once

#include <map>
#include <string>

#include "fetchbox/jobs/v1/task.pb.h"
#include "object_sink.hpp"

namespace fetchbox::storage {

inline constexpr const char* kDefaultBucket = "fetchbox-default";

struct DestinationDefaults {
  std::string                        bucket{kDefaultBucket};
  std::map<std::string, std::string> metadata;
};

/*
  key    = <hint.key_prefix>/<resource_id>
         | resources/<job_type>/<job_id>/<resource_id>
  bucket = hint.bucket | defaults.bucket
  metadata = defaults, overlaid by hint metadata, plus job-id/resource-id
*/
Destination ResolveDestination(const fetchbox::jobs::v1::Task& task, const DestinationDefaults& defaults);

} // namespace fetchbox::storage
