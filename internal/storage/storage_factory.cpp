#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "object/object_multipart_store.hpp"

namespace ingest::storage {

MultipartStorePtr StorageFactory::Build(const ingest::runtime::config::StorageConfig& cfg) {
  auto [object_fs, object_root] = common::Unwrap(common::ResolveFileSystem(cfg));
  return std::make_shared<ObjectMultipartStore>(std::move(object_fs), std::move(object_root), cfg.staging_prefix());
}

} // namespace ingest::storage
