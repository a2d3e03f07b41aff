#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace ingest::db::sqlite {

using ingest::db::ErrorCode;
using ingest::db::Result;

namespace {

constexpr const char* kSessionColumns =
    "id,total_length,content_type,owner,storage_key,upload_handle,state,declared_name,overwrite,storage_completed,"
    "created_at_ms,last_activity_at_ms,version,last_error";

constexpr const char* kLayerColumns =
    "id,layer_name,kind,crop,water_model,climate_model,scenario,variable,year,filename,storage_key,byte_size,min_value,max_value,"
    "global_average,enabled,uploaded_at_ms";

/*
  Owns a prepared statement for the scope of one repository call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindOptionalBool(sqlite3_stmt* st, int idx, const std::optional<bool>& v) {
  if (v.has_value()) {
    sqlite3_bind_int(st, idx, *v ? 1 : 0);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::optional<bool> ColOptionalBool(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int(st, col) != 0;
}

// Binds every session column after id, starting at idx.
int BindSessionFields(sqlite3_stmt* st, int idx, const model::UploadSessionRecord& r) {
  BindU64(st, idx++, r.total_length);
  BindText(st, idx++, r.content_type);
  BindText(st, idx++, r.owner);
  BindText(st, idx++, r.storage_key);
  BindText(st, idx++, r.upload_handle);
  BindI32(st, idx++, static_cast<int>(r.state));
  BindText(st, idx++, r.declared_name);
  BindOptionalBool(st, idx++, r.overwrite);
  BindI32(st, idx++, r.storage_completed ? 1 : 0);
  BindU64(st, idx++, r.created_at_ms);
  BindU64(st, idx++, r.last_activity_at_ms);
  BindU64(st, idx++, r.version);
  BindText(st, idx++, r.last_error);
  return idx;
}

model::UploadSessionRecord ReadSession(sqlite3_stmt* st) {
  model::UploadSessionRecord r;
  r.id                  = ColText(st, 0);
  r.total_length        = ColU64(st, 1);
  r.content_type        = ColText(st, 2);
  r.owner               = ColText(st, 3);
  r.storage_key         = ColText(st, 4);
  r.upload_handle       = ColText(st, 5);
  r.state               = static_cast<ingest::v1::UploadState>(ColI32(st, 6));
  r.declared_name       = ColText(st, 7);
  r.overwrite           = ColOptionalBool(st, 8);
  r.storage_completed   = ColI32(st, 9) != 0;
  r.created_at_ms       = ColU64(st, 10);
  r.last_activity_at_ms = ColU64(st, 11);
  r.version             = ColU64(st, 12);
  r.last_error          = ColText(st, 13);
  return r;
}

model::CatalogEntryRecord ReadLayer(sqlite3_stmt* st) {
  model::CatalogEntryRecord r;
  r.id             = ColText(st, 0);
  r.layer_name     = ColText(st, 1);
  r.kind           = static_cast<ingest::v1::LayerKind>(ColI32(st, 2));
  r.crop           = ColText(st, 3);
  r.water_model    = ColText(st, 4);
  r.climate_model  = ColText(st, 5);
  r.scenario       = ColText(st, 6);
  r.variable       = ColText(st, 7);
  r.year           = ColI32(st, 8);
  r.filename       = ColText(st, 9);
  r.storage_key    = ColText(st, 10);
  r.byte_size      = ColU64(st, 11);
  r.min_value      = sqlite3_column_double(st, 12);
  r.max_value      = sqlite3_column_double(st, 13);
  r.global_average = sqlite3_column_double(st, 14);
  r.enabled        = ColI32(st, 15) != 0;
  r.uploaded_at_ms = ColU64(st, 16);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("INSERT INTO upload_session(") + kSessionColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindSessionFields(st.get(), 2, r);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::UploadSessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kSessionColumns + " FROM upload_session WHERE id=?;");

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadSession(st.get());
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::UploadSessionRecord& r, uint64_t expected_version) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE upload_session SET total_length=?,content_type=?,owner=?,storage_key=?,upload_handle=?,state=?,declared_name=?,"
               "overwrite=?,storage_completed=?,created_at_ms=?,last_activity_at_ms=?,version=?,last_error=? WHERE id=? AND version=?;");

  int idx = BindSessionFields(st.get(), 1, r);
  BindText(st.get(), idx++, r.id);
  BindU64(st.get(), idx, expected_version);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) > 0) return Result::Ok();

  if (GetSession(t, r.id)) {
    return Result::Err(ErrorCode::Conflict, "session " + r.id + " was modified concurrently");
  }
  return Result::Err(ErrorCode::NotFound, "session " + r.id + " not found");
}

std::vector<model::UploadSessionRecord> SqliteRepository::ListStaleSessions(Transaction& t, uint64_t cutoff_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kSessionColumns + " FROM upload_session WHERE state NOT IN (?,?) AND last_activity_at_ms<? ORDER BY last_activity_at_ms;");

  BindI32(st.get(), 1, static_cast<int>(ingest::v1::UPLOAD_STATE_FINALIZED));
  BindI32(st.get(), 2, static_cast<int>(ingest::v1::UPLOAD_STATE_ABORTED));
  BindU64(st.get(), 3, cutoff_ms);

  std::vector<model::UploadSessionRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadSession(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Parts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPart(Transaction& t, const model::PartRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO upload_part(session_id,part_number,byte_offset,length,storage_tag,received_at_ms) VALUES(?,?,?,?,?,?) "
               "ON CONFLICT(session_id,part_number) DO UPDATE SET byte_offset=excluded.byte_offset,length=excluded.length,"
               "storage_tag=excluded.storage_tag,received_at_ms=excluded.received_at_ms;");

  BindText(st.get(), 1, r.session_id);
  BindU64(st.get(), 2, r.part_number);
  BindU64(st.get(), 3, r.offset);
  BindU64(st.get(), 4, r.length);
  BindText(st.get(), 5, r.storage_tag);
  BindU64(st.get(), 6, r.received_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::PartRecord> SqliteRepository::ListParts(Transaction& t, const std::string& session_id) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT session_id,part_number,byte_offset,length,storage_tag,received_at_ms FROM upload_part WHERE session_id=? "
               "ORDER BY part_number;");
  BindText(st.get(), 1, session_id);

  std::vector<model::PartRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::PartRecord r;
    r.session_id     = ColText(st.get(), 0);
    r.part_number    = static_cast<uint32_t>(ColU64(st.get(), 1));
    r.offset         = ColU64(st.get(), 2);
    r.length         = ColU64(st.get(), 3);
    r.storage_tag    = ColText(st.get(), 4);
    r.received_at_ms = ColU64(st.get(), 5);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::DeleteParts(Transaction& t, const std::string& session_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM upload_part WHERE session_id=?;");
  BindText(st.get(), 1, session_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Layers
// ------------------------------------------------------------------

std::optional<model::CatalogEntryRecord> SqliteRepository::FindLayerByName(Transaction& t, const std::string& layer_name) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kLayerColumns + " FROM layer WHERE layer_name=?;");
  BindText(st.get(), 1, layer_name);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadLayer(st.get());
}

Result SqliteRepository::InsertLayer(Transaction& t, const model::CatalogEntryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("INSERT INTO layer(") + kLayerColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.layer_name);
  BindI32(st.get(), 3, static_cast<int>(r.kind));
  BindText(st.get(), 4, r.crop);
  BindText(st.get(), 5, r.water_model);
  BindText(st.get(), 6, r.climate_model);
  BindText(st.get(), 7, r.scenario);
  BindText(st.get(), 8, r.variable);
  BindI32(st.get(), 9, r.year);
  BindText(st.get(), 10, r.filename);
  BindText(st.get(), 11, r.storage_key);
  BindU64(st.get(), 12, r.byte_size);
  BindDouble(st.get(), 13, r.min_value);
  BindDouble(st.get(), 14, r.max_value);
  BindDouble(st.get(), 15, r.global_average);
  BindI32(st.get(), 16, r.enabled ? 1 : 0);
  BindU64(st.get(), 17, r.uploaded_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteLayer(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM layer WHERE id=?;");
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace ingest::db::sqlite
