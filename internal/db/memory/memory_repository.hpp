#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace ingest::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::UploadSessionRecord>       sessions;
    std::unordered_map<std::string, std::map<uint32_t, model::PartRecord>> parts;
    std::unordered_map<std::string, model::CatalogEntryRecord>        layers; // by id
    std::unordered_map<std::string, std::string>                      layer_name_to_id;
  };

  // Held by a transaction for its whole lifetime.
  std::mutex write_mutex_;

  std::mutex state_mutex_;
  State      committed_;
};

} // namespace ingest::db::memory
