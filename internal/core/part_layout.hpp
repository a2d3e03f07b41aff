#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/db/model/part_record.hpp"

namespace ingest::core {

/*
  Part numbering for a chunked upload.

  Every non-terminal chunk has the same length L, so a chunk at offset o is
  part o / L + 1. The terminal chunk (ending at total_length) may be shorter,
  so it is numbered only once L is known from a recorded non-terminal part,
  or when it is the whole upload.
  Chunks whose layout disagrees with what is already recorded are rejected;
  numbering is never guessed.
*/

struct ChunkPlacement {
  uint32_t part_number = 0;
  bool     terminal    = false;
  // True when a part with the same number and range is already recorded.
  bool replaces_existing = false;
};

// Length shared by the recorded non-terminal parts, if any are recorded.
std::optional<uint64_t> UniformChunkLength(const std::vector<db::model::PartRecord>& parts, uint64_t total_length);

// Throws util::InvalidChunk when the chunk cannot be numbered consistently.
ChunkPlacement PlaceChunk(uint64_t offset, uint64_t length, uint64_t total_length, const std::vector<db::model::PartRecord>& parts);

// End of the contiguous run of parts starting at offset 0.
uint64_t ContiguousPrefix(const std::vector<db::model::PartRecord>& parts);

uint64_t ReceivedBytes(const std::vector<db::model::PartRecord>& parts);

inline bool CoversTotal(const std::vector<db::model::PartRecord>& parts, uint64_t total_length) {
  return ContiguousPrefix(parts) == total_length;
}

} // namespace ingest::core
