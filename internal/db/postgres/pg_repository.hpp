#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace ingest::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace ingest::db::postgres
