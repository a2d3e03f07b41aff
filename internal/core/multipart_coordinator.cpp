#include "multipart_coordinator.hpp"

#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ingest::core {

namespace {

bool IsTransient(const std::exception& e) {
  return dynamic_cast<const storage::StalePartError*>(&e) == nullptr && dynamic_cast<const std::invalid_argument*>(&e) == nullptr &&
         dynamic_cast<const std::logic_error*>(&e) == nullptr;
}

} // namespace

CoordinatorPolicies CoordinatorPolicies::FromConfig(const ingest::runtime::config::RetryConfig& config) {
  CoordinatorPolicies policies;
  policies.initiate    = config::ToRetryPolicy(config.initiate());
  policies.part_upload = config::ToRetryPolicy(config.part_upload());
  policies.complete    = config::ToRetryPolicy(config.complete());
  policies.abort       = config::ToRetryPolicy(config.abort());
  policies.object_io   = config::ToRetryPolicy(config.object_io());
  return policies;
}

MultipartCoordinator::MultipartCoordinator(storage::MultipartStorePtr store, CoordinatorPolicies policies)
    : store_(std::move(store)), policies_(policies) {
  if (!store_) {
    throw std::invalid_argument("multipart coordinator requires a store");
  }
}

template <typename Fn>
auto MultipartCoordinator::Run(const util::RetryPolicy& policy, const char* operation, const std::string& key, Fn&& fn) {
  try {
    return util::WithRetry(policy, operation, std::forward<Fn>(fn), IsTransient);
  } catch (const std::exception& e) {
    INGEST_LOG_ERROR("Storage call failed", {observability::StringField("operation", operation), observability::StringField("key", key),
                                             observability::StringField("error", e.what())});
    throw util::StorageUploadFailure(std::string(operation) + " " + key + ": " + e.what());
  }
}

std::string MultipartCoordinator::Initiate(const std::string& key) {
  return Run(policies_.initiate, "initiate", key, [&] { return store_->Initiate(key); });
}

std::string MultipartCoordinator::UploadPart(const std::string& key, const std::string& handle, uint32_t part_number,
                                             const std::shared_ptr<arrow::Buffer>& data) {
  return Run(policies_.part_upload, "upload_part", key, [&] { return store_->UploadPart(key, handle, part_number, data); });
}

storage::ObjectDescriptor MultipartCoordinator::Complete(const std::string& key, const std::string& handle,
                                                         const std::vector<storage::PartRef>& parts) {
  return Run(policies_.complete, "complete", key, [&] { return store_->Complete(key, handle, parts); });
}

void MultipartCoordinator::Abort(const std::string& key, const std::string& handle) {
  Run(policies_.abort, "abort", key, [&] { store_->Abort(key, handle); });
}

std::shared_ptr<arrow::Buffer> MultipartCoordinator::Read(const std::string& key) {
  return Run(policies_.object_io, "read", key, [&] { return store_->Read(key); });
}

void MultipartCoordinator::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  Run(policies_.object_io, "write", key, [&] { store_->Write(key, buffer); });
}

void MultipartCoordinator::Remove(const std::string& key) {
  Run(policies_.object_io, "remove", key, [&] { store_->Remove(key); });
}

} // namespace ingest::core
