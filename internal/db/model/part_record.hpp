#pragma once

#include <cstdint>
#include <string>

namespace ingest::db::model {

// One accepted chunk, keyed by (session_id, part_number).
struct PartRecord {
  std::string session_id;
  uint32_t    part_number = 0; // 1-based, assigned by the receiver
  uint64_t    offset      = 0;
  uint64_t    length      = 0;
  std::string storage_tag;
  uint64_t    received_at_ms = 0;
};

} // namespace ingest::db::model
