#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ingest/v1/types.pb.h"

namespace ingest::db::model {

/*
  Persistent upload session row.

  - state drives all behavior; fields being set or empty never do.
  - version is used for optimistic concurrency: an update carries the
    version it read and fails with Conflict when the row moved.
*/

struct UploadSessionRecord {
  std::string id; // UUID string

  uint64_t    total_length = 0;
  std::string content_type;
  std::string owner;

  // Raw object key and backend multipart handle (empty until initiated).
  std::string storage_key;
  std::string upload_handle;

  ingest::v1::UploadState state = ingest::v1::UPLOAD_STATE_UNSPECIFIED;

  // Filename; non-empty only once it passed validation.
  std::string declared_name;

  // Request-scoped overwrite flag; nullopt means the configured default.
  std::optional<bool> overwrite;

  bool storage_completed = false;

  uint64_t created_at_ms       = 0;
  uint64_t last_activity_at_ms = 0;

  uint64_t version = 0;

  std::string last_error;
};

} // namespace ingest::db::model
