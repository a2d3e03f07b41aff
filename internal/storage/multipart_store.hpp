#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ingest::storage {

struct PartRef {
  uint32_t    part_number = 0;
  std::string tag;
};

struct ObjectDescriptor {
  std::string key;
  uint64_t    size = 0;
};

/*
  A part tag referenced at completion no longer matches what is staged
  (missing part, replaced part, aborted upload). Retrying cannot help.
*/
class StalePartError : public std::runtime_error {
 public:
  explicit StalePartError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Object storage abstraction with a multipart upload protocol.

  Keys are relative to the store root and use '/' separators.

  Implementations:
    OBJECT → Arrow filesystem (local directory, S3 / MinIO)

  Backends never retry; retry policy is applied by the caller.
*/

class MultipartStore {
 public:
  virtual ~MultipartStore() = default;

  // ------------------------------------------------------------------
  // Multipart protocol
  // ------------------------------------------------------------------
  /*
    Start a multipart upload for key. Returns the backend handle that
    identifies the upload in every later call.
  */
  virtual std::string Initiate(const std::string& key) = 0;

  /*
    Store one part. Re-uploading a part number replaces the earlier part
    (last write wins) and invalidates its tag.
  */
  virtual std::string UploadPart(const std::string& key, const std::string& handle, uint32_t part_number,
                                 const std::shared_ptr<arrow::Buffer>& data) = 0;

  /*
    Assemble the parts, in the given order, into the object at key.
    Throws StalePartError if any tag does not match the staged part.
  */
  virtual ObjectDescriptor Complete(const std::string& key, const std::string& handle, const std::vector<PartRef>& parts) = 0;

  // Discard every staged part. Idempotent.
  virtual void Abort(const std::string& key, const std::string& handle) = 0;

  // ------------------------------------------------------------------
  // Whole objects
  // ------------------------------------------------------------------
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& key) = 0;

  virtual void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  // Idempotent; removing a missing object is not an error.
  virtual void Remove(const std::string& key) = 0;

  virtual uint64_t Size(const std::string& key) = 0;

  virtual bool Exists(const std::string& key) = 0;
};

using MultipartStorePtr = std::shared_ptr<MultipartStore>;

} // namespace ingest::storage
