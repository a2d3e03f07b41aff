#pragma once

#include "config/config.pb.h"
#include "multipart_store.hpp"

namespace ingest::storage {

/*
  Builds the object store from configuration.

      auto store = StorageFactory::Build(config.storage());
      auto handle = store->Initiate(key);
*/

class StorageFactory {
 public:
  static MultipartStorePtr Build(const ingest::runtime::config::StorageConfig& cfg);
};

} // namespace ingest::storage
