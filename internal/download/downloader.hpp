#pragma once

#include <cstddef>
#include <memory>

#include "internal/proxy/proxy_resolver.hpp"
#include "internal/util/cancellation.hpp"
#include "request.hpp"

namespace fetchbox::download {

/*
  Pull-based response body.

  Read() returns 0 at end of body. Transfer errors after the headers
  arrived surface as retry::TaskFailure from Read().
*/
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  virtual size_t Read(char* buffer, size_t size) = 0;
};

/*
  Downloader collaborator.

  Fetch() returns once the response status is known. HTTP status >= 400
  and connection level errors are thrown as retry::TaskFailure; a cancelled
  token raises retry::TaskCancelled.
*/
class Downloader {
 public:
  virtual ~Downloader() = default;

  virtual std::unique_ptr<ByteStream> Fetch(const DownloadRequest& request, const proxy::ProxyEndpoint& endpoint,
                                            const util::CancellationToken& cancel) = 0;
};

} // namespace fetchbox::download
