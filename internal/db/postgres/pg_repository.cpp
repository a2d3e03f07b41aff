#include "pg_repository.hpp"

namespace ingest::db::postgres {

namespace {

std::optional<bool> OptionalBool(const pqxx::field& field) {
  if (field.is_null()) return std::nullopt;
  return field.as<bool>();
}

model::UploadSessionRecord ReadSession(const pqxx::row& row) {
  model::UploadSessionRecord r;
  r.id                  = row[0].c_str();
  r.total_length        = row[1].as<uint64_t>();
  r.content_type        = row[2].c_str();
  r.owner               = row[3].c_str();
  r.storage_key         = row[4].c_str();
  r.upload_handle       = row[5].c_str();
  r.state               = (ingest::v1::UploadState)row[6].as<int>();
  r.declared_name       = row[7].c_str();
  r.overwrite           = OptionalBool(row[8]);
  r.storage_completed   = row[9].as<bool>();
  r.created_at_ms       = row[10].as<uint64_t>();
  r.last_activity_at_ms = row[11].as<uint64_t>();
  r.version             = row[12].as<uint64_t>();
  r.last_error          = row[13].c_str();
  return r;
}

model::CatalogEntryRecord ReadLayer(const pqxx::row& row) {
  model::CatalogEntryRecord r;
  r.id             = row[0].c_str();
  r.layer_name     = row[1].c_str();
  r.kind           = (ingest::v1::LayerKind)row[2].as<int>();
  r.crop           = row[3].c_str();
  r.water_model    = row[4].c_str();
  r.climate_model  = row[5].c_str();
  r.scenario       = row[6].c_str();
  r.variable       = row[7].c_str();
  r.year           = row[8].as<int32_t>();
  r.filename       = row[9].c_str();
  r.storage_key    = row[10].c_str();
  r.byte_size      = row[11].as<uint64_t>();
  r.min_value      = row[12].as<double>();
  r.max_value      = row[13].as<double>();
  r.global_average = row[14].as<double>();
  r.enabled        = row[15].as<bool>();
  r.uploaded_at_ms = row[16].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result PgRepository::InsertSession(Transaction& t, const model::UploadSessionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_session", r.id, r.total_length, r.content_type, r.owner, r.storage_key, r.upload_handle, (int)r.state,
                               r.declared_name, r.overwrite, r.storage_completed, r.created_at_ms, r.last_activity_at_ms, r.version,
                               r.last_error);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UploadSessionRecord> PgRepository::GetSession(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_session", id);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

Result PgRepository::UpdateSession(Transaction& t, const model::UploadSessionRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("update_session", r.id, r.total_length, r.content_type, r.owner, r.storage_key, r.upload_handle,
                                          (int)r.state, r.declared_name, r.overwrite, r.storage_completed, r.created_at_ms,
                                          r.last_activity_at_ms, r.version, r.last_error, expected_version);
    if (res.affected_rows() > 0) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (GetSession(t, r.id)) {
    return Result::Err(ErrorCode::Conflict, "session " + r.id + " was modified concurrently");
  }
  return Result::Err(ErrorCode::NotFound, "session " + r.id + " not found");
}

std::vector<model::UploadSessionRecord> PgRepository::ListStaleSessions(Transaction& t, uint64_t cutoff_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,total_length,content_type,owner,storage_key,upload_handle,state,declared_name,overwrite,storage_completed,"
      "created_at_ms,last_activity_at_ms,version,last_error FROM upload_session WHERE state NOT IN ($1,$2) AND last_activity_at_ms<$3 "
      "ORDER BY last_activity_at_ms;",
      (int)ingest::v1::UPLOAD_STATE_FINALIZED, (int)ingest::v1::UPLOAD_STATE_ABORTED, cutoff_ms);

  std::vector<model::UploadSessionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSession(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Parts
// ------------------------------------------------------------------

Result PgRepository::UpsertPart(Transaction& t, const model::PartRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_part", r.session_id, r.part_number, r.offset, r.length, r.storage_tag, r.received_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PartRecord> PgRepository::ListParts(Transaction& t, const std::string& session_id) {
  auto res = TX(t).Work().exec_prepared("list_parts", session_id);

  std::vector<model::PartRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::PartRecord r;
    r.session_id     = row[0].c_str();
    r.part_number    = row[1].as<uint32_t>();
    r.offset         = row[2].as<uint64_t>();
    r.length         = row[3].as<uint64_t>();
    r.storage_tag    = row[4].c_str();
    r.received_at_ms = row[5].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteParts(Transaction& t, const std::string& session_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM upload_part WHERE session_id=$1;", session_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Layers
// ------------------------------------------------------------------

std::optional<model::CatalogEntryRecord> PgRepository::FindLayerByName(Transaction& t, const std::string& layer_name) {
  auto res = TX(t).Work().exec_prepared("find_layer_by_name", layer_name);
  if (res.empty()) return std::nullopt;
  return ReadLayer(res[0]);
}

Result PgRepository::InsertLayer(Transaction& t, const model::CatalogEntryRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO layer(id,layer_name,kind,crop,water_model,climate_model,scenario,variable,year,filename,storage_key,byte_size,"
        "min_value,max_value,global_average,enabled,uploaded_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17);",
        r.id, r.layer_name, (int)r.kind, r.crop, r.water_model, r.climate_model, r.scenario, r.variable, r.year, r.filename, r.storage_key,
        r.byte_size, r.min_value, r.max_value, r.global_average, r.enabled, r.uploaded_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteLayer(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM layer WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace ingest::db::postgres
