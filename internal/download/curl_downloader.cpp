#include "curl_downloader.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <mutex>

#include "config/config.pb.h"
#include "internal/retry/failure.hpp"

namespace fetchbox::download {

using retry::FailureKind;
using retry::TaskCancelled;
using retry::TaskFailure;

namespace {

constexpr int kPollTimeoutMs = 100;

std::once_flag g_curl_init;

void GlobalInit() {
  std::call_once(g_curl_init, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

[[noreturn]] void ThrowTransferError(CURLcode code, const std::string& url, const char* detail) {
  std::string message = url + ": " + curl_easy_strerror(code);
  if (detail != nullptr && detail[0] != '\0') message += " (" + std::string(detail) + ")";

  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
      throw TaskFailure(FailureKind::kTimeout, message);
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
      throw TaskFailure(FailureKind::kDns, message);
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
      throw TaskFailure(FailureKind::kMalformedUrl, message);
    case CURLE_ABORTED_BY_CALLBACK:
      throw TaskCancelled("download cancelled: " + url);
    default:
      throw TaskFailure(FailureKind::kConnection, message);
  }
}

class CurlStream final : public ByteStream {
 public:
  CurlStream(const DownloadRequest& request, const proxy::ProxyEndpoint& endpoint, const CurlOptions& options,
             const util::CancellationToken& cancel)
      : url_(request.url), cancel_(cancel) {
    easy_  = curl_easy_init();
    multi_ = curl_multi_init();
    if (easy_ == nullptr || multi_ == nullptr) {
      Cleanup();
      throw TaskFailure(FailureKind::kInternalFault, "curl handle allocation failed");
    }

    for (const auto& [name, value] : request.headers) {
      // "Name;" is curl's spelling for a header sent with an empty value
      const std::string line = value.empty() ? name + ";" : name + ": " + value;
      headers_               = curl_slist_append(headers_, line.c_str());
    }

    error_[0] = '\0';
    curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(easy_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(easy_, CURLOPT_PROXY, endpoint.url.c_str());
    curl_easy_setopt(easy_, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, options.max_redirects > 0 ? 1L : 0L);
    curl_easy_setopt(easy_, CURLOPT_MAXREDIRS, static_cast<long>(options.max_redirects));
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(easy_, CURLOPT_TIMEOUT_MS, static_cast<long>(options.request_timeout.count()));
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, error_);
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlStream::OnWrite);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(easy_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(easy_, CURLOPT_XFERINFOFUNCTION, &CurlStream::OnProgress);
    curl_easy_setopt(easy_, CURLOPT_XFERINFODATA, this);

    if (curl_multi_add_handle(multi_, easy_) != CURLM_OK) {
      Cleanup();
      throw TaskFailure(FailureKind::kInternalFault, "curl_multi_add_handle failed");
    }
    attached_ = true;
  }

  ~CurlStream() override {
    Cleanup();
  }

  CurlStream(const CurlStream&)            = delete;
  CurlStream& operator=(const CurlStream&) = delete;

  /*
    Drives the transfer until the first body bytes arrive or it finishes,
    then checks the final response status.
  */
  void Open() {
    FillBuffer();

    long status = 0;
    curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
      throw TaskFailure::FromHttpStatus(static_cast<int>(status), url_);
    }
  }

  size_t Read(char* buffer, size_t size) override {
    if (offset_ >= pending_.size()) {
      pending_.clear();
      offset_ = 0;
      FillBuffer();
      if (pending_.empty()) return 0;
    }

    const size_t n = std::min(size, pending_.size() - offset_);
    std::memcpy(buffer, pending_.data() + offset_, n);
    offset_ += n;
    return n;
  }

 private:
  static size_t OnWrite(char* data, size_t size, size_t nmemb, void* user) {
    auto* self = static_cast<CurlStream*>(user);
    self->pending_.append(data, size * nmemb);
    return size * nmemb;
  }

  static int OnProgress(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* self = static_cast<CurlStream*>(user);
    return self->cancel_.IsCancelled() ? 1 : 0;
  }

  void FillBuffer() {
    while (pending_.empty() && !done_) {
      if (cancel_.IsCancelled()) {
        throw TaskCancelled("download cancelled: " + url_);
      }

      int running = 0;
      if (auto rc = curl_multi_perform(multi_, &running); rc != CURLM_OK) {
        throw TaskFailure(FailureKind::kConnection, url_ + ": " + curl_multi_strerror(rc));
      }

      if (running == 0) {
        Finish();
        break;
      }

      if (pending_.empty()) {
        int numfds = 0;
        if (auto rc = curl_multi_poll(multi_, nullptr, 0, kPollTimeoutMs, &numfds); rc != CURLM_OK) {
          throw TaskFailure(FailureKind::kConnection, url_ + ": " + curl_multi_strerror(rc));
        }
      }
    }
  }

  void Finish() {
    done_ = true;

    CURLcode result = CURLE_OK;
    int      queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
      if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
        result = msg->data.result;
      }
    }

    if (result != CURLE_OK) {
      ThrowTransferError(result, url_, error_);
    }
  }

  void Cleanup() {
    if (attached_) curl_multi_remove_handle(multi_, easy_);
    attached_ = false;
    if (easy_ != nullptr) curl_easy_cleanup(easy_);
    if (multi_ != nullptr) curl_multi_cleanup(multi_);
    if (headers_ != nullptr) curl_slist_free_all(headers_);
    easy_    = nullptr;
    multi_   = nullptr;
    headers_ = nullptr;
  }

  std::string                    url_;
  const util::CancellationToken& cancel_;

  CURL*       easy_     = nullptr;
  CURLM*      multi_    = nullptr;
  curl_slist* headers_  = nullptr;
  bool        attached_ = false;
  bool        done_     = false;
  char        error_[CURL_ERROR_SIZE];

  std::string pending_;
  size_t      offset_ = 0;
};

} // namespace

CurlOptions CurlOptions::FromConfig(const fetchbox::runtime::config::HttpConfig& config) {
  CurlOptions options;
  if (config.connect_timeout_ms() > 0) options.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms());
  if (config.request_timeout_ms() > 0) options.request_timeout = std::chrono::milliseconds(config.request_timeout_ms());
  if (!config.user_agent().empty()) options.user_agent = config.user_agent();
  if (config.has_max_redirects()) options.max_redirects = config.max_redirects();
  return options;
}

CurlDownloader::CurlDownloader(CurlOptions options) : options_(std::move(options)) {
  GlobalInit();
}

std::unique_ptr<ByteStream> CurlDownloader::Fetch(const DownloadRequest& request, const proxy::ProxyEndpoint& endpoint,
                                                  const util::CancellationToken& cancel) {
  if (request.url.empty()) {
    throw TaskFailure(FailureKind::kMalformedUrl, "task url is empty");
  }

  auto stream = std::make_unique<CurlStream>(request, endpoint, options_, cancel);
  stream->Open();
  return stream;
}

} // namespace fetchbox::download
