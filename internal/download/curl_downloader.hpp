#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "downloader.hpp"

namespace fetchbox::runtime::config {
class HttpConfig;
}

namespace fetchbox::download {

struct CurlOptions {
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds request_timeout{60000};
  std::string               user_agent{"FetchBox/0.1.0"};
  uint32_t                  max_redirects = 10;

  static CurlOptions FromConfig(const fetchbox::runtime::config::HttpConfig& config);
};

/*
  libcurl downloader.

  Each Fetch() owns a private multi handle driven by the reader: the
  transfer only advances while Read() is pulling, so at most one
  curl_multi_perform() worth of body is ever buffered.
*/
class CurlDownloader final : public Downloader {
 public:
  explicit CurlDownloader(CurlOptions options);

  std::unique_ptr<ByteStream> Fetch(const DownloadRequest& request, const proxy::ProxyEndpoint& endpoint,
                                    const util::CancellationToken& cancel) override;

 private:
  CurlOptions options_;
};

} // namespace fetchbox::download
