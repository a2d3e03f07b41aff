#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "ingest/v1/upload_service.grpc.pb.h"
#include "internal/service/upload_service.hpp"

namespace ingest::grpc {

class UploadServer final : public ingest::v1::UploadService::Service {
 public:
  explicit UploadServer(std::shared_ptr<ingest::service::UploadService> svc);

  ::grpc::Status CreateUpload(::grpc::ServerContext* ctx, const ingest::v1::CreateUploadRequest* req,
                              ingest::v1::CreateUploadResponse* resp) override;

  ::grpc::Status UploadChunk(::grpc::ServerContext* ctx, const ingest::v1::UploadChunkRequest* req,
                             ingest::v1::UploadChunkResponse* resp) override;

  ::grpc::Status GetUploadStatus(::grpc::ServerContext* ctx, const ingest::v1::GetUploadStatusRequest* req,
                                 ingest::v1::GetUploadStatusResponse* resp) override;

  ::grpc::Status FinalizeUpload(::grpc::ServerContext* ctx, const ingest::v1::FinalizeUploadRequest* req,
                                ingest::v1::FinalizeUploadResponse* resp) override;

  ::grpc::Status AbortUpload(::grpc::ServerContext* ctx, const ingest::v1::AbortUploadRequest* req, google::protobuf::Empty* resp) override;

 private:
  std::shared_ptr<ingest::service::UploadService> service_;
};

} // namespace ingest::grpc
