#include "chunk_receiver.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/catalog/catalog_registrar.hpp"
#include "internal/core/db_result.hpp"
#include "internal/core/duplicate_resolver.hpp"
#include "internal/core/multipart_coordinator.hpp"
#include "internal/core/part_layout.hpp"
#include "internal/metadata/filename_parser.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/raster/raster_converter.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ingest::core {

using ingest::v1::UploadState;
using namespace ingest::v1;

namespace {

uint64_t NowMs() {
  return util::NowUnixMillis();
}

void Transition(db::model::UploadSessionRecord& session, UploadState to) {
  if (!model::CanTransition(session.state, to)) {
    throw util::InvalidState("upload " + session.id + " cannot move from " + UploadState_Name(session.state) + " to " + UploadState_Name(to));
  }
  INGEST_LOG_INFO("Upload state changed", {observability::SessionField(session.id),
                                           observability::StringField("from", UploadState_Name(session.state)),
                                           observability::StringField("to", UploadState_Name(to))});
  session.state = to;
}

std::vector<storage::PartRef> ToPartRefs(const std::vector<db::model::PartRecord>& parts) {
  std::vector<storage::PartRef> refs;
  refs.reserve(parts.size());
  for (const auto& part : parts) {
    refs.push_back(storage::PartRef{part.part_number, part.storage_tag});
  }
  return refs;
}

} // namespace

/*
  Marks a session as finalizing for the lifetime of the guard.
*/
class ChunkReceiver::FinalizingGuard {
 public:
  FinalizingGuard(ChunkReceiver& receiver, std::string session_id) : receiver_(receiver), session_id_(std::move(session_id)) {
    std::lock_guard<std::mutex> lock(receiver_.finalizing_mutex_);
    if (!receiver_.finalizing_.insert(session_id_).second) {
      throw util::InvalidState("upload " + session_id_ + " is already being finalized");
    }
  }
  ~FinalizingGuard() {
    std::lock_guard<std::mutex> lock(receiver_.finalizing_mutex_);
    receiver_.finalizing_.erase(session_id_);
  }

  FinalizingGuard(const FinalizingGuard&)            = delete;
  FinalizingGuard& operator=(const FinalizingGuard&) = delete;

 private:
  ChunkReceiver& receiver_;
  std::string    session_id_;
};

// Counted reference to a session mutex; the map entry goes with the last one.
class ChunkReceiver::SessionMutexRef {
 public:
  SessionMutexRef(ChunkReceiver& receiver, std::string session_id, std::shared_ptr<std::shared_mutex> session_mutex)
      : receiver_(receiver), session_id_(std::move(session_id)), session_mutex_(std::move(session_mutex)) {}
  ~SessionMutexRef() {
    if (session_mutex_) receiver_.ReleaseSessionMutex(session_id_, session_mutex_);
  }

  SessionMutexRef(SessionMutexRef&& other) noexcept
      : receiver_(other.receiver_), session_id_(std::move(other.session_id_)), session_mutex_(std::move(other.session_mutex_)) {}
  SessionMutexRef(const SessionMutexRef&)            = delete;
  SessionMutexRef& operator=(const SessionMutexRef&) = delete;
  SessionMutexRef& operator=(SessionMutexRef&&)      = delete;

  std::shared_mutex& operator*() const {
    return *session_mutex_;
  }

 private:
  ChunkReceiver&                     receiver_;
  std::string                        session_id_;
  std::shared_ptr<std::shared_mutex> session_mutex_;
};

ChunkReceiver::ChunkReceiver(std::shared_ptr<db::Repository> repository, std::shared_ptr<MultipartCoordinator> coordinator,
                             std::shared_ptr<metadata::FilenameParser> parser, std::shared_ptr<DuplicateResolver> resolver,
                             std::shared_ptr<raster::RasterConverter> converter, std::shared_ptr<catalog::CatalogRegistrar> registrar,
                             ReceiverOptions options)
    : repository_(std::move(repository)),
      coordinator_(std::move(coordinator)),
      parser_(std::move(parser)),
      resolver_(std::move(resolver)),
      converter_(std::move(converter)),
      registrar_(std::move(registrar)),
      options_(std::move(options)) {
  if (!repository_ || !coordinator_ || !parser_ || !resolver_ || !converter_ || !registrar_) {
    throw std::invalid_argument("chunk receiver requires all collaborators");
  }
}

ChunkReceiver::SessionMutexRef ChunkReceiver::SessionMutex(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(session_mutexes_guard_);
  auto&                       session_mutex = session_mutexes_[session_id];
  if (!session_mutex) {
    session_mutex = std::make_shared<std::shared_mutex>();
  }
  return SessionMutexRef(*this, session_id, session_mutex);
}

void ChunkReceiver::ReleaseSessionMutex(const std::string& session_id, std::shared_ptr<std::shared_mutex>& session_mutex) {
  std::lock_guard<std::mutex> lock(session_mutexes_guard_);
  session_mutex.reset();
  auto it = session_mutexes_.find(session_id);
  if (it != session_mutexes_.end() && it->second.use_count() == 1) {
    session_mutexes_.erase(it);
  }
}

std::size_t ChunkReceiver::TrackedSessionCount() const {
  std::lock_guard<std::mutex> lock(session_mutexes_guard_);
  return session_mutexes_.size();
}

bool ChunkReceiver::IsFinalizing(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(finalizing_mutex_);
  return finalizing_.count(session_id) > 0;
}

db::model::UploadSessionRecord ChunkReceiver::LoadActive(db::Transaction& tx, const std::string& session_id) {
  auto session = repository_->GetSession(tx, session_id);
  if (!session || model::IsTerminal(session->state)) {
    throw util::NotFound("upload session " + session_id + " not found");
  }
  return *session;
}

void ChunkReceiver::Save(db::Transaction& tx, db::model::UploadSessionRecord& session) {
  const auto expected = session.version;
  session.version     = expected + 1;
  ThrowIfDbError(repository_->UpdateSession(tx, session, expected), "update upload session");
}

// ------------------------------------------------------------------
// Create
// ------------------------------------------------------------------

UploadStatus ChunkReceiver::Create(const CreateRequest& request) {
  if (request.total_length == 0) {
    throw util::InvalidChunk("total length must be positive");
  }
  if (!request.name.empty()) {
    parser_->Parse(request.name);
  }

  db::model::UploadSessionRecord session;
  session.id                  = util::NewId();
  session.total_length        = request.total_length;
  session.content_type        = request.content_type;
  session.owner               = request.owner;
  session.storage_key         = storage::common::JoinKey(options_.input_prefix, session.id);
  session.state               = UPLOAD_STATE_CREATED;
  session.declared_name       = request.name;
  session.overwrite           = request.overwrite;
  session.created_at_ms       = NowMs();
  session.last_activity_at_ms = session.created_at_ms;
  session.version             = 1;

  auto session_mutex = SessionMutex(session.id);
  std::unique_lock<std::shared_mutex> session_lock(*session_mutex);

  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertSession(*tx, session), "create upload session");
    tx->Commit();
  }
  INGEST_LOG_INFO("Upload session created", {observability::SessionField(session.id),
                                             observability::IntField("total_length", static_cast<int64_t>(session.total_length)),
                                             observability::StringField("owner", session.owner)});

  std::string handle;
  try {
    handle = coordinator_->Initiate(session.storage_key);
  } catch (const util::StorageUploadFailure& e) {
    auto tx = repository_->Begin();
    Transition(session, UPLOAD_STATE_ABORTED);
    session.last_error = e.what();
    Save(*tx, session);
    tx->Commit();
    throw;
  }

  auto tx               = repository_->Begin();
  session.upload_handle = handle;
  Transition(session, UPLOAD_STATE_RECEIVING);
  Save(*tx, session);
  tx->Commit();

  return BuildStatus(session, {});
}

// ------------------------------------------------------------------
// Chunk
// ------------------------------------------------------------------

ChunkOutcome ChunkReceiver::Chunk(const ChunkRequest& request) {
  const uint64_t received = request.data ? static_cast<uint64_t>(request.data->size()) : 0;

  ChunkOutcome outcome;
  bool         completed = false;
  {
    auto                                session_mutex = SessionMutex(request.session_id);
    std::unique_lock<std::shared_mutex> session_lock(*session_mutex);

    db::model::UploadSessionRecord session;
    std::vector<db::model::PartRecord> parts;
    {
      auto tx = repository_->Begin();
      session = LoadActive(*tx, request.session_id);
      parts   = repository_->ListParts(*tx, session.id);
      tx->Commit();
    }

    if (request.total_length != session.total_length) {
      throw util::InvalidChunk("declared total length " + std::to_string(request.total_length) + " does not match session total length " +
                               std::to_string(session.total_length));
    }
    if (request.content_length == 0 || request.content_length != received) {
      throw util::InvalidChunk("content length " + std::to_string(request.content_length) + " does not match " + std::to_string(received) +
                               " received bytes");
    }
    if (session.state == UPLOAD_STATE_COMPLETING) {
      throw util::InvalidState("upload " + session.id + " already received every byte; finalize it instead");
    }
    if (session.state != UPLOAD_STATE_RECEIVING) {
      throw util::InvalidState("upload " + session.id + " is not accepting chunks in state " + UploadState_Name(session.state));
    }

    if (session.declared_name.empty()) {
      if (request.name.empty()) {
        throw util::InvalidFilenameFormat("a filename is required with the first chunk");
      }
      parser_->Parse(request.name);
      session.declared_name = request.name;
    } else if (!request.name.empty() && request.name != session.declared_name) {
      throw util::InvalidChunk("filename '" + request.name + "' differs from the session filename '" + session.declared_name + "'");
    }

    const auto placement = PlaceChunk(request.offset, request.content_length, session.total_length, parts);
    const auto tag       = coordinator_->UploadPart(session.storage_key, session.upload_handle, placement.part_number, request.data);

    db::model::PartRecord part;
    part.session_id     = session.id;
    part.part_number    = placement.part_number;
    part.offset         = request.offset;
    part.length         = request.content_length;
    part.storage_tag    = tag;
    part.received_at_ms = NowMs();

    if (placement.replaces_existing) {
      for (auto& existing : parts) {
        if (existing.part_number == part.part_number) existing = part;
      }
    } else {
      parts.push_back(part);
    }

    session.last_activity_at_ms = part.received_at_ms;
    completed                   = CoversTotal(parts, session.total_length);
    if (completed) {
      Transition(session, UPLOAD_STATE_COMPLETING);
    }

    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->UpsertPart(*tx, part), "record part");
    Save(*tx, session);
    tx->Commit();

    observability::Metrics::Instance().AddChunkBytes(received);
    outcome.part_number = placement.part_number;
    outcome.status      = BuildStatus(session, parts);
  }

  if (completed) {
    auto finalized = RunFinalize(request.session_id);
    outcome.status = finalized.status;
    outcome.entry  = finalized.entry;
  }
  return outcome;
}

// ------------------------------------------------------------------
// Status
// ------------------------------------------------------------------

UploadStatus ChunkReceiver::Status(const std::string& session_id) {
  auto                                session_mutex = SessionMutex(session_id);
  std::shared_lock<std::shared_mutex> session_lock(*session_mutex);

  auto tx      = repository_->Begin();
  auto session = LoadActive(*tx, session_id);
  auto parts   = repository_->ListParts(*tx, session_id);
  tx->Commit();
  return BuildStatus(session, parts);
}

UploadStatus ChunkReceiver::BuildStatus(const db::model::UploadSessionRecord& session, const std::vector<db::model::PartRecord>& parts) const {
  UploadStatus status;
  status.set_session_id(session.id);
  status.set_state(session.state);
  status.set_total_length(session.total_length);
  status.set_next_expected_offset(ContiguousPrefix(parts));
  status.set_received_bytes(ReceivedBytes(parts));
  status.set_part_count(static_cast<uint32_t>(parts.size()));
  status.set_declared_name(session.declared_name);
  status.set_last_error(session.last_error);
  *status.mutable_created_at()       = util::UnixMillisToProto(session.created_at_ms);
  *status.mutable_last_activity_at() = util::UnixMillisToProto(session.last_activity_at_ms);
  return status;
}

// ------------------------------------------------------------------
// Finalize
// ------------------------------------------------------------------

FinalizeOutcome ChunkReceiver::Finalize(const std::string& session_id) {
  {
    auto                                session_mutex = SessionMutex(session_id);
    std::shared_lock<std::shared_mutex> session_lock(*session_mutex);

    auto tx      = repository_->Begin();
    auto session = LoadActive(*tx, session_id);
    tx->Commit();
    if (session.state != UPLOAD_STATE_COMPLETING) {
      throw util::IncompleteUpload("upload " + session_id + " has not received every byte (state " + UploadState_Name(session.state) + ")");
    }
  }
  return RunFinalize(session_id);
}

/*
  complete -> resolve duplicate -> convert -> write layer -> register
  -> remove raw input -> Finalized

  Safe to rerun after a failure at any step: storage completion is recorded
  and never repeated, and parts are never re-uploaded.
*/
FinalizeOutcome ChunkReceiver::RunFinalize(const std::string& session_id) {
  FinalizingGuard guard(*this, session_id);
  observability::SpanScope span("ingest.finalize");
  span.SetSession(session_id);
  const auto started = std::chrono::steady_clock::now();
  auto       elapsed = [&started] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  };

  try {
    auto session_mutex = SessionMutex(session_id);

    db::model::UploadSessionRecord     session;
    std::vector<db::model::PartRecord> parts;
    {
      std::shared_lock<std::shared_mutex> session_lock(*session_mutex);
      auto                                tx = repository_->Begin();
      session                                = LoadActive(*tx, session_id);
      parts                                  = repository_->ListParts(*tx, session_id);
      tx->Commit();
    }
    if (session.state != UPLOAD_STATE_COMPLETING) {
      throw util::InvalidState("upload " + session_id + " is not ready to finalize (state " + UploadState_Name(session.state) + ")");
    }

    const auto key = parser_->Parse(session.declared_name);

    if (!session.storage_completed) {
      const auto object = coordinator_->Complete(session.storage_key, session.upload_handle, ToPartRefs(parts));
      if (object.size != session.total_length) {
        throw util::StorageUploadFailure("completed object " + object.key + " has " + std::to_string(object.size) + " bytes, expected " +
                                         std::to_string(session.total_length));
      }

      std::unique_lock<std::shared_mutex> session_lock(*session_mutex);
      auto                                tx = repository_->Begin();
      session                                = LoadActive(*tx, session_id);
      session.storage_completed              = true;
      Save(*tx, session);
      tx->Commit();
      INGEST_LOG_INFO("Multipart upload completed", {observability::SessionField(session_id),
                                                     observability::StringField("key", object.key)});
    }

    resolver_->Resolve(key.layer_name(), session.overwrite);

    const auto raw       = coordinator_->Read(session.storage_key);
    const auto converted = converter_->Convert(raw, session.declared_name);

    db::model::CatalogEntryRecord entry;
    entry.id             = util::NewId();
    entry.layer_name     = key.layer_name();
    entry.kind           = key.kind();
    entry.crop           = key.crop();
    entry.water_model    = key.water_model();
    entry.climate_model  = key.climate_model();
    entry.scenario       = key.scenario();
    entry.variable       = key.variable();
    entry.year           = key.year();
    entry.filename       = session.declared_name;
    entry.storage_key    = storage::common::JoinKey(options_.layer_prefix, key.layer_name() + "/" + entry.id + ".tif");
    entry.byte_size      = static_cast<uint64_t>(converted.data->size());
    entry.min_value      = converted.statistics.min_value;
    entry.max_value      = converted.statistics.max_value;
    entry.global_average = converted.statistics.mean;
    entry.enabled        = true;
    entry.uploaded_at_ms = NowMs();

    coordinator_->Write(entry.storage_key, converted.data);
    try {
      registrar_->Register(entry);
    } catch (const std::exception&) {
      try {
        coordinator_->Remove(entry.storage_key);
      } catch (const std::exception& cleanup) {
        INGEST_LOG_WARN("Unregistered layer object left behind", {observability::StringField("key", entry.storage_key),
                                                                  observability::StringField("error", cleanup.what())});
      }
      throw;
    }

    if (!options_.retain_raw_inputs) {
      try {
        coordinator_->Remove(session.storage_key);
      } catch (const util::StorageUploadFailure& e) {
        INGEST_LOG_WARN("Raw input not removed", {observability::SessionField(session_id),
                                                  observability::StringField("key", session.storage_key),
                                                  observability::StringField("error", e.what())});
      }
    }

    FinalizeOutcome outcome;
    {
      std::unique_lock<std::shared_mutex> session_lock(*session_mutex);
      auto                                tx = repository_->Begin();
      session                                = LoadActive(*tx, session_id);
      Transition(session, UPLOAD_STATE_FINALIZED);
      session.last_error          = "";
      session.last_activity_at_ms = NowMs();
      Save(*tx, session);
      ThrowIfDbError(repository_->DeleteParts(*tx, session_id), "delete parts");
      tx->Commit();
      outcome.status = BuildStatus(session, parts);
    }

    outcome.entry = catalog::ToCatalogEntry(entry);
    observability::Metrics::Instance().ObserveFinalizeDurationMs("ok", elapsed());
    INGEST_LOG_INFO("Upload finalized", {observability::SessionField(session_id), observability::StringField("layer_id", entry.id),
                                         observability::StringField("layer_name", entry.layer_name)});
    return outcome;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().ObserveFinalizeDurationMs("failed", elapsed());
    INGEST_LOG_ERROR("Finalize failed", {observability::SessionField(session_id), observability::StringField("error", e.what())});
    RecordFinalizeFailure(session_id, e.what());
    throw;
  }
}

void ChunkReceiver::RecordFinalizeFailure(const std::string& session_id, const std::string& message) {
  try {
    auto                                session_mutex = SessionMutex(session_id);
    std::unique_lock<std::shared_mutex> session_lock(*session_mutex);

    auto tx      = repository_->Begin();
    auto session = repository_->GetSession(*tx, session_id);
    if (!session || session->state != UPLOAD_STATE_COMPLETING) {
      return;
    }
    session->last_error = message;
    Save(*tx, *session);
    tx->Commit();
  } catch (const std::exception& e) {
    INGEST_LOG_ERROR("Could not record finalize failure", {observability::SessionField(session_id),
                                                           observability::StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Abort / expiry
// ------------------------------------------------------------------

/*
  Storage first, then local state: a failed storage call leaves the session
  intact for the next attempt.

  Caller holds the session lock exclusively.
*/
void ChunkReceiver::Cancel(db::model::UploadSessionRecord session, const char* reason) {
  if (session.storage_completed) {
    coordinator_->Remove(session.storage_key);
  } else if (!session.upload_handle.empty()) {
    coordinator_->Abort(session.storage_key, session.upload_handle);
  }

  auto tx = repository_->Begin();
  session = LoadActive(*tx, session.id);
  Transition(session, UPLOAD_STATE_ABORTED);
  session.last_error = reason;
  Save(*tx, session);
  ThrowIfDbError(repository_->DeleteParts(*tx, session.id), "delete parts");
  tx->Commit();

  INGEST_LOG_INFO("Upload aborted", {observability::SessionField(session.id), observability::StringField("reason", reason)});
}

void ChunkReceiver::Abort(const std::string& session_id) {
  {
    auto                                session_mutex = SessionMutex(session_id);
    std::unique_lock<std::shared_mutex> session_lock(*session_mutex);

    auto tx      = repository_->Begin();
    auto session = LoadActive(*tx, session_id);
    tx->Commit();

    if (IsFinalizing(session_id)) {
      throw util::InvalidState("upload " + session_id + " is being finalized");
    }
    Cancel(std::move(session), "aborted by client");
  }
}

bool ChunkReceiver::ExpireIfStale(const std::string& session_id, uint64_t cutoff_ms) {
  {
    auto                                session_mutex = SessionMutex(session_id);
    std::unique_lock<std::shared_mutex> session_lock(*session_mutex);

    auto tx      = repository_->Begin();
    auto session = repository_->GetSession(*tx, session_id);
    tx->Commit();

    if (!session || model::IsTerminal(session->state) || session->last_activity_at_ms >= cutoff_ms || IsFinalizing(session_id)) {
      return false;
    }
    Cancel(std::move(*session), "expired");
  }
  return true;
}

} // namespace ingest::core
