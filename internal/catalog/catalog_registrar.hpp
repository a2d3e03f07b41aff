#pragma once

#include <memory>

#include "ingest/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/retry.hpp"

namespace ingest::catalog {

/*
  Persists catalog entries.

  Registration is exactly-once per layer_name: the catalog's unique
  constraint turns a concurrent second registration into
  util::DuplicateEntry, which is never retried.
*/
class CatalogRegistrar {
 public:
  CatalogRegistrar(std::shared_ptr<db::Repository> repository, util::RetryPolicy policy);

  void Register(const db::model::CatalogEntryRecord& entry);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::RetryPolicy               policy_;
};

ingest::v1::CatalogEntry ToCatalogEntry(const db::model::CatalogEntryRecord& record);

} // namespace ingest::catalog
