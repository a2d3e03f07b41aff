#include "catalog_registrar.hpp"

#include "internal/core/db_result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ingest::catalog {

namespace {

bool IsRetryable(const std::exception& e) {
  return dynamic_cast<const util::DuplicateEntry*>(&e) == nullptr;
}

} // namespace

CatalogRegistrar::CatalogRegistrar(std::shared_ptr<db::Repository> repository, util::RetryPolicy policy)
    : repository_(std::move(repository)), policy_(policy) {
}

void CatalogRegistrar::Register(const db::model::CatalogEntryRecord& entry) {
  util::WithRetry(
      policy_, "register_layer",
      [&] {
        auto tx     = repository_->Begin();
        auto result = repository_->InsertLayer(*tx, entry);
        if (result.code == db::ErrorCode::AlreadyExists) {
          throw util::DuplicateEntry("layer " + entry.layer_name + " is already registered");
        }
        core::ThrowIfDbError(result, "register layer");
        tx->Commit();
      },
      IsRetryable);

  INGEST_LOG_INFO("Layer registered", {observability::StringField("layer_id", entry.id), observability::StringField("layer_name", entry.layer_name),
                                       observability::IntField("byte_size", static_cast<int64_t>(entry.byte_size))});
}

ingest::v1::CatalogEntry ToCatalogEntry(const db::model::CatalogEntryRecord& record) {
  ingest::v1::CatalogEntry entry;
  entry.set_id(record.id);

  auto* key = entry.mutable_key();
  key->set_kind(record.kind);
  key->set_crop(record.crop);
  key->set_water_model(record.water_model);
  key->set_climate_model(record.climate_model);
  key->set_scenario(record.scenario);
  key->set_variable(record.variable);
  key->set_year(record.year);
  key->set_layer_name(record.layer_name);

  entry.set_filename(record.filename);
  entry.set_storage_key(record.storage_key);
  entry.set_byte_size(record.byte_size);
  entry.set_min_value(record.min_value);
  entry.set_max_value(record.max_value);
  entry.set_global_average(record.global_average);
  entry.set_enabled(record.enabled);
  *entry.mutable_uploaded_at() = util::UnixMillisToProto(record.uploaded_at_ms);
  return entry;
}

} // namespace ingest::catalog
