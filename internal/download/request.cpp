#include "request.hpp"

#include <algorithm>
#include <cctype>

namespace fetchbox::download {

bool HeaderNameEquals(const std::string& a, const std::string& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

std::vector<Header> MergeHeaders(const std::map<std::string, std::string>&                               defaults,
                                 const google::protobuf::RepeatedPtrField<fetchbox::jobs::v1::HttpHeader>& task_headers) {
  std::vector<Header> merged;
  merged.reserve(defaults.size() + static_cast<size_t>(task_headers.size()));

  for (const auto& [name, value] : defaults) {
    const bool overridden = std::any_of(task_headers.begin(), task_headers.end(),
                                        [&](const fetchbox::jobs::v1::HttpHeader& h) { return HeaderNameEquals(h.name(), name); });
    if (!overridden) merged.emplace_back(name, value);
  }

  for (const auto& header : task_headers) {
    merged.emplace_back(header.name(), header.value());
  }

  return merged;
}

DownloadRequest BuildRequest(const fetchbox::jobs::v1::Task& task, const std::map<std::string, std::string>& default_headers) {
  DownloadRequest request;
  request.url     = task.url();
  request.headers = MergeHeaders(default_headers, task.headers());
  return request;
}

} // namespace fetchbox::download
