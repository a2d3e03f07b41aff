#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ingest::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                                    InsertSession(Transaction&, const model::UploadSessionRecord&) override;
  std::optional<model::UploadSessionRecord> GetSession(Transaction&, const std::string&) override;
  Result                                    UpdateSession(Transaction&, const model::UploadSessionRecord&, uint64_t expected_version) override;
  std::vector<model::UploadSessionRecord>   ListStaleSessions(Transaction&, uint64_t cutoff_ms) override;

  Result                         UpsertPart(Transaction&, const model::PartRecord&) override;
  std::vector<model::PartRecord> ListParts(Transaction&, const std::string&) override;
  Result                         DeleteParts(Transaction&, const std::string&) override;

  std::optional<model::CatalogEntryRecord> FindLayerByName(Transaction&, const std::string&) override;
  Result                                   InsertLayer(Transaction&, const model::CatalogEntryRecord&) override;
  Result                                   DeleteLayer(Transaction&, const std::string&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace ingest::db::sqlite
