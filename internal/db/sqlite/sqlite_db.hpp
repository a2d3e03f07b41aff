#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace ingest::db::sqlite {

struct SqliteOptions {
  int  busy_timeout_ms = 5000;
  bool full_sync       = false;
};

/*
  RAII owner of the single sqlite3* connection shared by the repository.

  Opened in WAL mode with foreign keys on, so deleting a session cascades
  to its upload_part rows.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // One open transaction per connection at a time.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Runs one or more statements without results (pragmas, DDL, BEGIN/COMMIT).
  void Exec(const std::string& sql);

  // Caller owns the statement and must sqlite3_finalize it.
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace ingest::db::sqlite
