#pragma once

#include <stdexcept>
#include <string>

namespace ingest::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Filename does not match a known layer naming scheme. Raised before any
// bytes are stored.
class InvalidFilenameFormat : public std::runtime_error {
 public:
  explicit InvalidFilenameFormat(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Chunk offsets/lengths inconsistent with the session or with earlier chunks.
class InvalidChunk : public std::runtime_error {
 public:
  explicit InvalidChunk(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateEntry : public std::runtime_error {
 public:
  explicit DuplicateEntry(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageUploadFailure : public std::runtime_error {
 public:
  explicit StorageUploadFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValueRangeInvalid : public std::runtime_error {
 public:
  explicit ValueRangeInvalid(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RasterConversionFailure : public std::runtime_error {
 public:
  explicit RasterConversionFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IncompleteUpload : public std::runtime_error {
 public:
  explicit IncompleteUpload(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic concurrency check lost against a concurrent writer.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ingest::util
