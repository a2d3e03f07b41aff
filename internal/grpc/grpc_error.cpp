#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace ingest::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace ingest::util;

  if (dynamic_cast<const InvalidFilenameFormat*>(&e) || dynamic_cast<const InvalidChunk*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const DuplicateEntry*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const StorageUploadFailure*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const ValueRangeInvalid*>(&e) || dynamic_cast<const RasterConversionFailure*>(&e) ||
      dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const IncompleteUpload*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace ingest::grpc
