#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace ingest::storage::common {

namespace {

bool IsS3Uri(const std::string& uri) {
  return uri.rfind("s3://", 0) == 0;
}

arrow::Status EnsureS3() {
  if (arrow::fs::IsS3Initialized()) {
    return arrow::Status::OK();
  }
  return arrow::fs::EnsureS3Initialized();
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const ingest::runtime::config::StorageConfig& storage_config) {
  std::string resolved_path = storage_config.root_uri();

  if (!IsS3Uri(resolved_path)) {
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(resolved_path, &resolved_path));
    return std::make_pair(std::move(fs), resolved_path);
  }

  ARROW_RETURN_NOT_OK(EnsureS3());

  if (!storage_config.has_s3()) {
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(resolved_path, &resolved_path));
    return std::make_pair(std::move(fs), resolved_path);
  }

  const auto& proto_options = storage_config.s3();
  ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(resolved_path, &resolved_path));
  if (!proto_options.region().empty()) {
    options.region = proto_options.region();
  }
  if (!proto_options.endpoint_override().empty()) {
    options.endpoint_override = proto_options.endpoint_override();
  }
  if (!proto_options.scheme().empty()) {
    options.scheme = proto_options.scheme();
  }
  if (!proto_options.access_key().empty()) {
    options.ConfigureAccessKey(proto_options.access_key(), proto_options.secret_key());
  }
  options.force_virtual_addressing = proto_options.force_virtual_addressing();
  if (proto_options.connect_timeout() > 0) {
    options.connect_timeout = proto_options.connect_timeout();
  }
  if (proto_options.request_timeout() > 0) {
    options.request_timeout = proto_options.request_timeout();
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
}

} // namespace ingest::storage::common
