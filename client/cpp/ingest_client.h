#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "api/ingest/v1.hpp"

namespace ingest::client {

/*
  Thin wrapper over the UploadService stub.

  gRPC failures map onto arrow::Status:
    UNAVAILABLE, ABORTED, DEADLINE_EXCEEDED -> IOError (retryable)
    NOT_FOUND                               -> KeyError
    ALREADY_EXISTS                          -> AlreadyExists
    anything else                           -> Invalid
*/
class IngestClient {
 public:
  struct UploadOptions {
    uint64_t            chunk_size = 8ull * 1024ull * 1024ull;
    std::string         content_type{"image/tiff"};
    std::string         owner;
    std::optional<bool> overwrite;
    // Attempts per chunk and per finalize, counting the first.
    uint32_t                  max_attempts = 5;
    std::chrono::milliseconds retry_backoff{500};
    // Called after every accepted chunk with (next_expected_offset, total).
    std::function<void(uint64_t, uint64_t)> progress;
  };

  struct UploadResult {
    std::string              session_id;
    ingest::v1::CatalogEntry entry;
  };

  explicit IngestClient(std::shared_ptr<grpc::Channel> channel);

  arrow::Result<ingest::v1::CreateUploadResponse> CreateUpload(const ingest::v1::CreateUploadRequest& request) const;

  arrow::Result<ingest::v1::UploadChunkResponse> UploadChunk(const ingest::v1::UploadChunkRequest& request) const;

  arrow::Result<ingest::v1::UploadStatus> GetUploadStatus(const std::string& session_id) const;

  arrow::Result<ingest::v1::FinalizeUploadResponse> FinalizeUpload(const std::string& session_id) const;

  arrow::Status AbortUpload(const std::string& session_id) const;

  // Uploads a local file in uniform chunks. With a session_id the upload
  // resumes from the server's next expected offset.
  arrow::Result<UploadResult> UploadFile(const std::string& path, const UploadOptions& options,
                                         const std::string& session_id = std::string()) const;

 private:
  arrow::Result<UploadResult> SendFrom(const std::string& path, const std::string& name, uint64_t total, const std::string& session_id,
                                       const UploadOptions& options) const;
  arrow::Result<ingest::v1::CatalogEntry> FinalizeWithRetry(const std::string& session_id, const UploadOptions& options) const;

  std::unique_ptr<ingest::v1::UploadService::Stub> stub_;
};

} // namespace ingest::client
