#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/multipart_store.hpp"

namespace ingest::storage {

/*
  Multipart object store over an Arrow filesystem (local directory, S3 / MinIO).

  Layout under the root:

      <staging_prefix>/<handle>/<part_number>   staged parts
      <key>                                     completed objects

  A part tag is the content digest and length of the staged bytes, so a
  replaced or missing part is detected at completion.
*/

class ObjectMultipartStore final : public MultipartStore {
 public:
  ObjectMultipartStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string staging_prefix);

  std::string Initiate(const std::string& key) override;

  std::string UploadPart(const std::string& key, const std::string& handle, uint32_t part_number,
                         const std::shared_ptr<arrow::Buffer>& data) override;

  ObjectDescriptor Complete(const std::string& key, const std::string& handle, const std::vector<PartRef>& parts) override;

  void Abort(const std::string& key, const std::string& handle) override;

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  void Remove(const std::string& key) override;

  uint64_t Size(const std::string& key) override;

  bool Exists(const std::string& key) override;

  // Tag for a byte range as returned by UploadPart.
  static std::string PartTag(const uint8_t* data, int64_t size);

 private:
  std::string ObjectPath(const std::string& key) const;
  std::string StagingDir(const std::string& handle) const;
  std::string PartPath(const std::string& handle, uint32_t part_number) const;

  void EnsureParentDir(const std::string& path);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  std::string                            staging_prefix_;
};

} // namespace ingest::storage
