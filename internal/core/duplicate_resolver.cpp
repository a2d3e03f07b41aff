#include "duplicate_resolver.hpp"

#include "internal/core/db_result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ingest::core {

DuplicateResolver::DuplicateResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<MultipartCoordinator> coordinator,
                                     bool default_overwrite)
    : repository_(std::move(repository)), coordinator_(std::move(coordinator)), default_overwrite_(default_overwrite) {
}

std::optional<db::model::CatalogEntryRecord> DuplicateResolver::Resolve(const std::string& layer_name, std::optional<bool> overwrite) {
  std::optional<db::model::CatalogEntryRecord> existing;
  {
    auto tx  = repository_->Begin();
    existing = repository_->FindLayerByName(*tx, layer_name);
    if (!existing) {
      return std::nullopt;
    }

    if (!overwrite.value_or(default_overwrite_)) {
      throw util::DuplicateEntry("layer " + layer_name + " already exists; enable overwrite to replace it");
    }

    ThrowIfDbError(repository_->DeleteLayer(*tx, existing->id), "delete duplicate layer");
    tx->Commit();
  }

  // Entry first, object second: a crash in between leaves an orphan object,
  // never an entry pointing at missing bytes.
  coordinator_->Remove(existing->storage_key);

  INGEST_LOG_INFO("Duplicate layer replaced", {observability::StringField("layer_name", layer_name),
                                               observability::StringField("previous_id", existing->id)});
  return existing;
}

} // namespace ingest::core
