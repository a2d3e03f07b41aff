#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace ingest::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  if (path_.empty()) {
    throw std::invalid_argument("sqlite database path is empty");
  }

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  INGEST_LOG_INFO("SQLite database opened", {observability::StringField("path", path_), observability::BoolField("full_sync", options_.full_sync)});
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr), db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // Readers (STATUS) keep going while a chunk transaction writes.
  Exec("PRAGMA journal_mode=WAL;");
  Exec(options_.full_sync ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms > 0 ? options_.busy_timeout_ms : 5000), db_, "sqlite busy_timeout");
  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace ingest::db::sqlite
