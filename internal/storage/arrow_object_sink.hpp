#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "object_sink.hpp"

namespace fetchbox::storage {

/*
  ObjectSink over an arrow::fs::FileSystem.

  Object layout:

      <root_path>/<bucket>/<key>
*/
class ArrowObjectSink final : public ObjectSink {
 public:
  ArrowObjectSink(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, bool checksum);

  UploadedRef Upload(download::ByteStream& body, const Destination& destination) override;

  std::string ObjectPath(const Destination& destination) const;

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  bool                                   checksum_;
};

// Maps an Arrow storage error onto the upload failure taxonomy.
[[noreturn]] void ThrowUploadFailure(const arrow::Status& status, const std::string& path);

} // namespace fetchbox::storage
