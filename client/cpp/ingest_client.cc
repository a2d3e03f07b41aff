#include "client/cpp/ingest_client.h"

#include <grpcpp/client_context.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <thread>

namespace ingest::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::ABORTED:
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::ALREADY_EXISTS:
      return arrow::Status::AlreadyExists(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
  }
}

arrow::Result<std::string> ReadRange(std::ifstream& in, uint64_t offset, uint64_t length) {
  std::string data(length, '\0');
  in.clear();
  in.seekg(static_cast<std::streamoff>(offset));
  in.read(data.data(), static_cast<std::streamsize>(length));
  if (static_cast<uint64_t>(in.gcount()) != length) {
    return arrow::Status::IOError("short read at offset ", offset);
  }
  return data;
}

} // namespace

IngestClient::IngestClient(std::shared_ptr<grpc::Channel> channel) : stub_(ingest::v1::UploadService::NewStub(channel)) {
}

arrow::Result<ingest::v1::CreateUploadResponse> IngestClient::CreateUpload(const ingest::v1::CreateUploadRequest& request) const {
  grpc::ClientContext              ctx;
  ingest::v1::CreateUploadResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->CreateUpload(&ctx, request, &response), "CreateUpload"));
  return response;
}

arrow::Result<ingest::v1::UploadChunkResponse> IngestClient::UploadChunk(const ingest::v1::UploadChunkRequest& request) const {
  grpc::ClientContext             ctx;
  ingest::v1::UploadChunkResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->UploadChunk(&ctx, request, &response), "UploadChunk"));
  return response;
}

arrow::Result<ingest::v1::UploadStatus> IngestClient::GetUploadStatus(const std::string& session_id) const {
  grpc::ClientContext                 ctx;
  ingest::v1::GetUploadStatusRequest  request;
  ingest::v1::GetUploadStatusResponse response;
  request.set_session_id(session_id);
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetUploadStatus(&ctx, request, &response), "GetUploadStatus"));
  return response.status();
}

arrow::Result<ingest::v1::FinalizeUploadResponse> IngestClient::FinalizeUpload(const std::string& session_id) const {
  grpc::ClientContext                ctx;
  ingest::v1::FinalizeUploadRequest  request;
  ingest::v1::FinalizeUploadResponse response;
  request.set_session_id(session_id);
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->FinalizeUpload(&ctx, request, &response), "FinalizeUpload"));
  return response;
}

arrow::Status IngestClient::AbortUpload(const std::string& session_id) const {
  grpc::ClientContext            ctx;
  ingest::v1::AbortUploadRequest request;
  google::protobuf::Empty        response;
  request.set_session_id(session_id);
  return GrpcToArrow(stub_->AbortUpload(&ctx, request, &response), "AbortUpload");
}

arrow::Result<IngestClient::UploadResult> IngestClient::UploadFile(const std::string& path, const UploadOptions& options,
                                                                   const std::string& session_id) const {
  if (options.chunk_size == 0) {
    return arrow::Status::Invalid("chunk size must be positive");
  }

  std::error_code ec;
  const auto      size = std::filesystem::file_size(path, ec);
  if (ec) {
    return arrow::Status::IOError("stat ", path, ": ", ec.message());
  }
  const auto name = std::filesystem::path(path).filename().string();

  if (!session_id.empty()) {
    return SendFrom(path, name, size, session_id, options);
  }

  ingest::v1::CreateUploadRequest create;
  create.set_total_length(size);
  create.set_content_type(options.content_type);
  create.set_owner(options.owner);
  create.set_name(name);
  if (options.overwrite) {
    create.set_overwrite(*options.overwrite);
  }
  ARROW_ASSIGN_OR_RAISE(auto created, CreateUpload(create));
  return SendFrom(path, name, size, created.session_id(), options);
}

/*
  Sends chunks from the server's next expected offset. A retryable failure
  re-reads STATUS before resending, so a chunk the server already accepted is
  not sent twice in a row.
*/
arrow::Result<IngestClient::UploadResult> IngestClient::SendFrom(const std::string& path, const std::string& name, uint64_t total,
                                                                 const std::string& session_id, const UploadOptions& options) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return arrow::Status::IOError("open ", path);
  }

  ARROW_ASSIGN_OR_RAISE(auto status, GetUploadStatus(session_id));
  if (status.total_length() != total) {
    return arrow::Status::Invalid("session ", session_id, " expects ", status.total_length(), " bytes but ", path, " has ", total);
  }

  UploadResult result;
  result.session_id = session_id;

  if (status.state() == ingest::v1::UPLOAD_STATE_COMPLETING) {
    ARROW_ASSIGN_OR_RAISE(result.entry, FinalizeWithRetry(session_id, options));
    return result;
  }

  uint64_t offset   = status.next_expected_offset();
  uint32_t failures = 0;
  while (offset < total) {
    const uint64_t length = std::min<uint64_t>(options.chunk_size, total - offset);
    ARROW_ASSIGN_OR_RAISE(auto data, ReadRange(in, offset, length));

    ingest::v1::UploadChunkRequest chunk;
    chunk.set_session_id(session_id);
    chunk.set_offset(offset);
    chunk.set_total_length(total);
    chunk.set_content_length(length);
    chunk.set_name(name);
    chunk.set_data(std::move(data));

    auto response = UploadChunk(chunk);
    if (!response.ok()) {
      if (!response.status().IsIOError() || ++failures >= options.max_attempts) {
        return response.status();
      }
      std::this_thread::sleep_for(options.retry_backoff * failures);
      ARROW_ASSIGN_OR_RAISE(status, GetUploadStatus(session_id));
      if (status.state() == ingest::v1::UPLOAD_STATE_COMPLETING) {
        ARROW_ASSIGN_OR_RAISE(result.entry, FinalizeWithRetry(session_id, options));
        return result;
      }
      offset = status.next_expected_offset();
      continue;
    }

    failures = 0;
    offset   = response->status().next_expected_offset();
    if (options.progress) {
      options.progress(offset, total);
    }
    if (response->finalized()) {
      result.entry = response->entry();
      return result;
    }
  }

  // Every byte is on the server but the completing chunk did not finalize.
  ARROW_ASSIGN_OR_RAISE(result.entry, FinalizeWithRetry(session_id, options));
  return result;
}

// Finalize-only retries under the same attempt budget as a chunk.
arrow::Result<ingest::v1::CatalogEntry> IngestClient::FinalizeWithRetry(const std::string& session_id, const UploadOptions& options) const {
  for (uint32_t attempt = 1;; ++attempt) {
    auto finalized = FinalizeUpload(session_id);
    if (finalized.ok()) {
      return finalized->entry();
    }
    if (!finalized.status().IsIOError() || attempt >= options.max_attempts) {
      return finalized.status();
    }
    std::this_thread::sleep_for(options.retry_backoff * attempt);
  }
}

} // namespace ingest::client
