#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/catalog_entry_record.hpp"
#include "internal/db/model/part_record.hpp"
#include "internal/db/model/upload_session_record.hpp"

namespace ingest::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - UpdateSession is a compare-and-swap on version
  - layer_name is unique; a second insert fails with AlreadyExists

  The DB is the source of truth for:
    upload sessions and their parts
    the layer catalog
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Upload sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::UploadSessionRecord&) = 0;

  virtual std::optional<model::UploadSessionRecord> GetSession(Transaction&, const std::string& id) = 0;

  // Writes the record if the stored version still equals expected_version.
  // Conflict when it moved, NotFound when the row is absent.
  virtual Result UpdateSession(Transaction&, const model::UploadSessionRecord&, uint64_t expected_version) = 0;

  // Non-terminal sessions whose last activity is older than cutoff_ms.
  virtual std::vector<model::UploadSessionRecord> ListStaleSessions(Transaction&, uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Parts
  // ---------------------------------------------------------------------

  // Inserts or replaces the part with the same (session_id, part_number).
  virtual Result UpsertPart(Transaction&, const model::PartRecord&) = 0;

  // Ordered by part_number.
  virtual std::vector<model::PartRecord> ListParts(Transaction&, const std::string& session_id) = 0;

  virtual Result DeleteParts(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Layer catalog
  // ---------------------------------------------------------------------

  virtual std::optional<model::CatalogEntryRecord> FindLayerByName(Transaction&, const std::string& layer_name) = 0;

  virtual Result InsertLayer(Transaction&, const model::CatalogEntryRecord&) = 0;

  virtual Result DeleteLayer(Transaction&, const std::string& id) = 0;
};

} // namespace ingest::db
