#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/download/downloader.hpp"

namespace fetchbox::storage {

struct Destination {
  std::string                        bucket;
  std::string                        key;
  std::map<std::string, std::string> metadata;
};

struct UploadedRef {
  std::string bucket;
  std::string key;
  uint64_t    bytes = 0;
  std::string checksum; // hex sha-256, empty when disabled
};

/*
  Storage collaborator.

  Upload() consumes the body stream to its end. Storage errors are thrown as
  retry::TaskFailure in the Upload phase; errors raised by the body stream
  propagate unchanged. A failed upload leaves no object behind.
*/
class ObjectSink {
 public:
  virtual ~ObjectSink() = default;

  virtual UploadedRef Upload(download::ByteStream& body, const Destination& destination) = 0;
};

} // namespace fetchbox::storage
