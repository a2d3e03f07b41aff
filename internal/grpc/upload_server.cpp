#include "upload_server.hpp"

#include "grpc_error.hpp"

namespace ingest::grpc {

UploadServer::UploadServer(std::shared_ptr<ingest::service::UploadService> svc) : service_(std::move(svc)) {
}

::grpc::Status UploadServer::CreateUpload(::grpc::ServerContext*, const ingest::v1::CreateUploadRequest* req,
                                          ingest::v1::CreateUploadResponse* resp) {
  try {
    *resp = service_->CreateUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::UploadChunk(::grpc::ServerContext*, const ingest::v1::UploadChunkRequest* req,
                                         ingest::v1::UploadChunkResponse* resp) {
  try {
    *resp = service_->UploadChunk(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::GetUploadStatus(::grpc::ServerContext*, const ingest::v1::GetUploadStatusRequest* req,
                                             ingest::v1::GetUploadStatusResponse* resp) {
  try {
    *resp = service_->GetUploadStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::FinalizeUpload(::grpc::ServerContext*, const ingest::v1::FinalizeUploadRequest* req,
                                            ingest::v1::FinalizeUploadResponse* resp) {
  try {
    *resp = service_->FinalizeUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::AbortUpload(::grpc::ServerContext*, const ingest::v1::AbortUploadRequest* req, google::protobuf::Empty*) {
  try {
    service_->AbortUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace ingest::grpc
