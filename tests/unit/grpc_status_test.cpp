#include <grpcpp/grpcpp.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace {

using ingest::grpc::ToStatus;
using namespace ingest::util;

void TestServiceErrorsMapToStatusCodes() {
  assert(ToStatus(InvalidFilenameFormat("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(InvalidChunk("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(DuplicateEntry("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(StorageUploadFailure("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(ValueRangeInvalid("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(RasterConversionFailure("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(IncompleteUpload("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(Conflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
}

void TestUnknownErrorsAreInternal() {
  const auto status = ToStatus(std::runtime_error("disk on fire"));
  assert(status.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(status.error_message() == "disk on fire");
}

} // namespace

int main() {
  TestServiceErrorsMapToStatusCodes();
  TestUnknownErrorsAreInternal();

  std::cout << "grpc_status_test: pass\n";
  return 0;
}
