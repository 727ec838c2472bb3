#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "fetchbox/jobs/v1/task.pb.h"

namespace fetchbox::download {

using Header = std::pair<std::string, std::string>;

struct DownloadRequest {
  std::string         url;
  std::vector<Header> headers;
};

/*
  Default headers first (sorted by name), then the task headers in their
  original order. A default whose name matches any task header
  (case-insensitive) is dropped, so the task value wins.
*/
std::vector<Header> MergeHeaders(const std::map<std::string, std::string>&                               defaults,
                                 const google::protobuf::RepeatedPtrField<fetchbox::jobs::v1::HttpHeader>& task_headers);

DownloadRequest BuildRequest(const fetchbox::jobs::v1::Task& task, const std::map<std::string, std::string>& default_headers);

bool HeaderNameEquals(const std::string& a, const std::string& b);

} // namespace fetchbox::download
