#include "memory_repository.hpp"

#include "internal/model/state_machine.hpp"
#include "memory_tx.hpp"

namespace ingest::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "session " + r.id + " already exists");
  s.sessions[r.id] = r;
  return Result::Ok();
}

std::optional<model::UploadSessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::UploadSessionRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sessions.find(r.id);
  if (it == s.sessions.end()) return Result::Err(ErrorCode::NotFound, "session " + r.id + " not found");
  if (it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "session " + r.id + " was modified concurrently");
  }
  it->second = r;
  return Result::Ok();
}

std::vector<model::UploadSessionRecord> MemoryRepository::ListStaleSessions(Transaction& t, uint64_t cutoff_ms) {
  std::vector<model::UploadSessionRecord> out;
  for (const auto& [_, session] : TX(t).View().sessions) {
    if (!ingest::model::IsTerminal(session.state) && session.last_activity_at_ms < cutoff_ms) {
      out.push_back(session);
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Parts
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPart(Transaction& t, const model::PartRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.session_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "part references unknown session " + r.session_id);
  }
  s.parts[r.session_id][r.part_number] = r;
  return Result::Ok();
}

std::vector<model::PartRecord> MemoryRepository::ListParts(Transaction& t, const std::string& session_id) {
  std::vector<model::PartRecord> out;
  const auto&                    s  = TX(t).View();
  auto                           it = s.parts.find(session_id);
  if (it == s.parts.end()) return out;
  out.reserve(it->second.size());
  for (const auto& [_, part] : it->second) {
    out.push_back(part);
  }
  return out;
}

Result MemoryRepository::DeleteParts(Transaction& t, const std::string& session_id) {
  TX(t).Mutable().parts.erase(session_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Layers
// ------------------------------------------------------------------

std::optional<model::CatalogEntryRecord> MemoryRepository::FindLayerByName(Transaction& t, const std::string& layer_name) {
  const auto& s  = TX(t).View();
  auto        it = s.layer_name_to_id.find(layer_name);
  if (it == s.layer_name_to_id.end()) return std::nullopt;
  return s.layers.at(it->second);
}

Result MemoryRepository::InsertLayer(Transaction& t, const model::CatalogEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.layer_name_to_id.contains(r.layer_name)) {
    return Result::Err(ErrorCode::AlreadyExists, "layer " + r.layer_name + " already exists");
  }
  if (s.layers.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "layer id " + r.id + " already exists");
  }
  s.layers[r.id]                   = r;
  s.layer_name_to_id[r.layer_name] = r.id;
  return Result::Ok();
}

Result MemoryRepository::DeleteLayer(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.layers.find(id);
  if (it == s.layers.end()) return Result::Ok();
  s.layer_name_to_id.erase(it->second.layer_name);
  s.layers.erase(it);
  return Result::Ok();
}

} // namespace ingest::db::memory
