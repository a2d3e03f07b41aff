#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace ingest::grpc {

/*
  Maps an ingest failure onto the status an uploader sees.

    InvalidFilenameFormat, InvalidChunk      INVALID_ARGUMENT
    NotFound                                 NOT_FOUND
    DuplicateEntry                           ALREADY_EXISTS
    StorageUploadFailure                     UNAVAILABLE
    ValueRangeInvalid, RasterConversionFailure,
    InvalidState, IncompleteUpload           FAILED_PRECONDITION
    Conflict                                 ABORTED
    anything else                            INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace ingest::grpc
