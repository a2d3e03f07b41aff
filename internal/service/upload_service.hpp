#pragma once

#include "ingest/v1/upload_service.pb.h"
#include "service_context.hpp"

namespace ingest::service {

class UploadService {
 public:
  explicit UploadService(ServiceContext ctx);

  ingest::v1::CreateUploadResponse CreateUpload(const ingest::v1::CreateUploadRequest& req);

  ingest::v1::UploadChunkResponse UploadChunk(const ingest::v1::UploadChunkRequest& req);

  ingest::v1::GetUploadStatusResponse GetUploadStatus(const ingest::v1::GetUploadStatusRequest& req);

  ingest::v1::FinalizeUploadResponse FinalizeUpload(const ingest::v1::FinalizeUploadRequest& req);

  void AbortUpload(const ingest::v1::AbortUploadRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace ingest::service
