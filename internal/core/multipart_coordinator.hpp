#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/storage/multipart_store.hpp"
#include "internal/util/retry.hpp"

namespace ingest::core {

struct CoordinatorPolicies {
  util::RetryPolicy initiate;
  util::RetryPolicy part_upload;
  util::RetryPolicy complete;
  util::RetryPolicy abort;
  util::RetryPolicy object_io;

  static CoordinatorPolicies FromConfig(const ingest::runtime::config::RetryConfig& config);
};

/*
  Multipart storage coordinator.

  Runs every store call under its retry policy and reports exhausted or
  permanent failures as util::StorageUploadFailure. Stale part tags and
  invalid keys are permanent and never retried.
*/
class MultipartCoordinator {
 public:
  MultipartCoordinator(storage::MultipartStorePtr store, CoordinatorPolicies policies);

  std::string Initiate(const std::string& key);

  std::string UploadPart(const std::string& key, const std::string& handle, uint32_t part_number, const std::shared_ptr<arrow::Buffer>& data);

  // parts must be ordered by part number.
  storage::ObjectDescriptor Complete(const std::string& key, const std::string& handle, const std::vector<storage::PartRef>& parts);

  void Abort(const std::string& key, const std::string& handle);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key);
  void                           Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer);
  void                           Remove(const std::string& key);

 private:
  template <typename Fn>
  auto Run(const util::RetryPolicy& policy, const char* operation, const std::string& key, Fn&& fn);

  storage::MultipartStorePtr store_;
  CoordinatorPolicies        policies_;
};

} // namespace ingest::core
