#include "object_multipart_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <cstdio>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/uuid.hpp"

namespace ingest::storage {

using namespace ingest::storage::common;

namespace {

// FNV-1a, 64 bit.
uint64_t Digest(const uint8_t* data, int64_t size) {
  uint64_t hash = 14695981039346656037ull;
  for (int64_t i = 0; i < size; ++i) {
    hash ^= data[i];
    hash *= 1099511628211ull;
  }
  return hash;
}

std::string ParentOf(const std::string& path) {
  const auto slash = path.find_last_of('/');
  if (slash == std::string::npos) return {};
  return path.substr(0, slash);
}

} // namespace

ObjectMultipartStore::ObjectMultipartStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string staging_prefix)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), staging_prefix_(std::move(staging_prefix)) {
  if (!fs_) {
    throw std::invalid_argument("object store requires a filesystem");
  }
  ValidateKey(staging_prefix_);
  if (!root_path_.empty()) {
    Unwrap(fs_->CreateDir(root_path_, /*recursive=*/true));
  }
}

std::string ObjectMultipartStore::PartTag(const uint8_t* data, int64_t size) {
  char tag[48];
  std::snprintf(tag, sizeof(tag), "%016llx-%lld", static_cast<unsigned long long>(Digest(data, size)), static_cast<long long>(size));
  return tag;
}

std::string ObjectMultipartStore::ObjectPath(const std::string& key) const {
  return common::ObjectPath(root_path_, key);
}

std::string ObjectMultipartStore::StagingDir(const std::string& handle) const {
  return common::ObjectPath(root_path_, JoinKey(staging_prefix_, handle));
}

std::string ObjectMultipartStore::PartPath(const std::string& handle, uint32_t part_number) const {
  return JoinKey(StagingDir(handle), std::to_string(part_number));
}

void ObjectMultipartStore::EnsureParentDir(const std::string& path) {
  const auto parent = ParentOf(path);
  if (!parent.empty()) {
    Unwrap(fs_->CreateDir(parent, /*recursive=*/true));
  }
}

/*
  Handles are fresh UUIDs; the staging directory is created eagerly so an
  abort of an upload with no parts still has something to remove.
*/
std::string ObjectMultipartStore::Initiate(const std::string& key) {
  ValidateKey(key);
  auto handle = util::NewId();
  Unwrap(fs_->CreateDir(StagingDir(handle), /*recursive=*/true));
  return handle;
}

std::string ObjectMultipartStore::UploadPart(const std::string& key, const std::string& handle, uint32_t part_number,
                                             const std::shared_ptr<arrow::Buffer>& data) {
  ValidateKey(key);
  if (part_number == 0) {
    throw std::invalid_argument("part numbers are 1-based");
  }
  auto info = Unwrap(fs_->GetFileInfo(StagingDir(handle)));
  if (info.type() != arrow::fs::FileType::Directory) {
    throw StalePartError("multipart upload " + handle + " does not exist");
  }

  const auto path = PartPath(handle, part_number);
  auto       out  = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(data->data(), data->size()));
  Unwrap(out->Close());
  return PartTag(data->data(), data->size());
}

/*
  Parts are concatenated in the order given. Every staged part is re-read and
  its tag recomputed before anything is written, so a stale reference leaves
  the destination untouched.
*/
ObjectDescriptor ObjectMultipartStore::Complete(const std::string& key, const std::string& handle, const std::vector<PartRef>& parts) {
  if (parts.empty()) {
    throw StalePartError("multipart upload " + handle + " has no parts");
  }

  std::vector<std::shared_ptr<arrow::Buffer>> buffers;
  buffers.reserve(parts.size());
  uint32_t previous = 0;
  for (const auto& part : parts) {
    if (part.part_number <= previous) {
      throw StalePartError("parts must be strictly ordered by part number");
    }
    previous = part.part_number;

    const auto path = PartPath(handle, part.part_number);
    auto       info = Unwrap(fs_->GetFileInfo(path));
    if (info.type() != arrow::fs::FileType::File) {
      throw StalePartError("part " + std::to_string(part.part_number) + " of upload " + handle + " is missing");
    }
    auto buffer = ReadAll(Unwrap(fs_->OpenInputFile(path)));
    if (PartTag(buffer->data(), buffer->size()) != part.tag) {
      throw StalePartError("part " + std::to_string(part.part_number) + " of upload " + handle + " has a stale tag");
    }
    buffers.push_back(std::move(buffer));
  }

  const auto object_path = ObjectPath(key);
  EnsureParentDir(object_path);

  uint64_t size = 0;
  {
    auto out = Unwrap(fs_->OpenOutputStream(object_path));
    for (const auto& buffer : buffers) {
      Unwrap(out->Write(buffer->data(), buffer->size()));
      size += static_cast<uint64_t>(buffer->size());
    }
    Unwrap(out->Close());
  }

  Unwrap(fs_->DeleteDir(StagingDir(handle)));
  return ObjectDescriptor{key, size};
}

void ObjectMultipartStore::Abort(const std::string& key, const std::string& handle) {
  ValidateKey(key);
  const auto dir  = StagingDir(handle);
  auto       info = Unwrap(fs_->GetFileInfo(dir));
  if (info.type() == arrow::fs::FileType::NotFound) {
    return;
  }
  Unwrap(fs_->DeleteDir(dir));
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ObjectMultipartStore::Read(const std::string& key) {
  return ReadAll(Unwrap(fs_->OpenInputFile(ObjectPath(key))));
}

void ObjectMultipartStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  const auto path = ObjectPath(key);
  EnsureParentDir(path);
  auto out = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(buffer->data(), buffer->size()));
  Unwrap(out->Close());
}

void ObjectMultipartStore::Remove(const std::string& key) {
  const auto path = ObjectPath(key);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() == arrow::fs::FileType::NotFound) {
    return;
  }
  Unwrap(fs_->DeleteFile(path));
}

uint64_t ObjectMultipartStore::Size(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  if (info.type() != arrow::fs::FileType::File) {
    throw std::runtime_error("object " + key + " does not exist");
  }
  return static_cast<uint64_t>(info.size());
}

bool ObjectMultipartStore::Exists(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.type() == arrow::fs::FileType::File;
}

} // namespace ingest::storage
