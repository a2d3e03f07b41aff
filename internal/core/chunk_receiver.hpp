#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "ingest/v1/types.pb.h"
#include "internal/db/api/repository.hpp"

namespace ingest::metadata {
class FilenameParser;
}
namespace ingest::raster {
class RasterConverter;
}
namespace ingest::catalog {
class CatalogRegistrar;
}

namespace ingest::core {

class MultipartCoordinator;
class DuplicateResolver;

struct ReceiverOptions {
  std::string input_prefix{"inputs"};
  std::string layer_prefix{"layers"};
  bool        retain_raw_inputs{false};
};

struct CreateRequest {
  uint64_t            total_length = 0;
  std::string         content_type;
  std::string         owner;
  std::string         name;
  std::optional<bool> overwrite;
};

struct ChunkRequest {
  std::string session_id;
  uint64_t    offset         = 0;
  uint64_t    total_length   = 0;
  uint64_t    content_length = 0;
  std::string name;
  // Caller keeps the bytes alive for the duration of the call.
  std::shared_ptr<arrow::Buffer> data;
};

struct ChunkOutcome {
  ingest::v1::UploadStatus                status;
  uint32_t                                part_number = 0;
  std::optional<ingest::v1::CatalogEntry> entry;
};

struct FinalizeOutcome {
  ingest::v1::UploadStatus status;
  ingest::v1::CatalogEntry entry;
};

/*
  Upload session state machine.

      Created -> Receiving -> Completing -> Finalized
                     \            \
                      +------------+--> Aborted

  Concurrency:
    - one std::shared_mutex per session; chunk bookkeeping takes it
      exclusively, Status takes it shared. A mutex lives only while some
      call holds a reference to it, so ids that never name a live session
      leave nothing behind
    - the finalize sequence runs outside that lock, guarded by a per-session
      finalizing marker; a second finalize gets util::InvalidState
    - every persisted update is a compare-and-swap on the session version

  Finalized and Aborted sessions are reported as util::NotFound.
*/
class ChunkReceiver {
 public:
  ChunkReceiver(std::shared_ptr<db::Repository> repository, std::shared_ptr<MultipartCoordinator> coordinator,
                std::shared_ptr<metadata::FilenameParser> parser, std::shared_ptr<DuplicateResolver> resolver,
                std::shared_ptr<raster::RasterConverter> converter, std::shared_ptr<catalog::CatalogRegistrar> registrar, ReceiverOptions options);

  ingest::v1::UploadStatus Create(const CreateRequest& request);

  // When this chunk completes the upload, the finalize sequence runs before
  // returning and its failure is rethrown; the chunk itself stays recorded.
  ChunkOutcome Chunk(const ChunkRequest& request);

  ingest::v1::UploadStatus Status(const std::string& session_id);

  // Finalize-only retry for a session in Completing.
  FinalizeOutcome Finalize(const std::string& session_id);

  void Abort(const std::string& session_id);

  // Aborts the session if it is still idle since before cutoff_ms.
  // Returns false when it was touched, finished or is finalizing.
  bool ExpireIfStale(const std::string& session_id, uint64_t cutoff_ms);

  // Sessions with a call in flight.
  std::size_t TrackedSessionCount() const;

 private:
  class FinalizingGuard;
  class SessionMutexRef;

  SessionMutexRef SessionMutex(const std::string& session_id);
  void            ReleaseSessionMutex(const std::string& session_id, std::shared_ptr<std::shared_mutex>& session_mutex);
  bool            IsFinalizing(const std::string& session_id) const;

  db::model::UploadSessionRecord LoadActive(db::Transaction& tx, const std::string& session_id);
  void                           Save(db::Transaction& tx, db::model::UploadSessionRecord& session);
  void                           Cancel(db::model::UploadSessionRecord session, const char* reason);

  FinalizeOutcome RunFinalize(const std::string& session_id);
  void            RecordFinalizeFailure(const std::string& session_id, const std::string& message);

  ingest::v1::UploadStatus BuildStatus(const db::model::UploadSessionRecord& session, const std::vector<db::model::PartRecord>& parts) const;

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<MultipartCoordinator>      coordinator_;
  std::shared_ptr<metadata::FilenameParser>  parser_;
  std::shared_ptr<DuplicateResolver>         resolver_;
  std::shared_ptr<raster::RasterConverter>   converter_;
  std::shared_ptr<catalog::CatalogRegistrar> registrar_;
  ReceiverOptions                            options_;

  mutable std::mutex                                                          session_mutexes_guard_;
  mutable std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> session_mutexes_;

  mutable std::mutex              finalizing_mutex_;
  std::unordered_set<std::string> finalizing_;
};

} // namespace ingest::core
