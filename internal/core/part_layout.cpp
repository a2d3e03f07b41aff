#include "part_layout.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace ingest::core {

namespace {

std::string Range(uint64_t offset, uint64_t length) {
  return "[" + std::to_string(offset) + ", " + std::to_string(offset + length) + ")";
}

uint32_t ToPartNumber(uint64_t index) {
  if (index >= std::numeric_limits<uint32_t>::max()) {
    throw util::InvalidChunk("part number " + std::to_string(index + 1) + " is out of range");
  }
  return static_cast<uint32_t>(index + 1);
}

bool IsTerminal(const db::model::PartRecord& part, uint64_t total_length) {
  return part.offset + part.length == total_length;
}

} // namespace

std::optional<uint64_t> UniformChunkLength(const std::vector<db::model::PartRecord>& parts, uint64_t total_length) {
  for (const auto& part : parts) {
    if (!IsTerminal(part, total_length)) {
      return part.length;
    }
  }
  return std::nullopt;
}

ChunkPlacement PlaceChunk(uint64_t offset, uint64_t length, uint64_t total_length, const std::vector<db::model::PartRecord>& parts) {
  if (length == 0) {
    throw util::InvalidChunk("chunk length must be positive");
  }
  if (offset >= total_length || length > total_length - offset) {
    throw util::InvalidChunk("chunk " + Range(offset, length) + " exceeds total length " + std::to_string(total_length));
  }

  ChunkPlacement placement;
  placement.terminal = offset + length == total_length;

  const auto uniform = UniformChunkLength(parts, total_length);
  if (!placement.terminal) {
    if (offset % length != 0) {
      throw util::InvalidChunk("chunk " + Range(offset, length) + " is not aligned to its own length");
    }
    if (uniform && *uniform != length) {
      throw util::InvalidChunk("chunk length " + std::to_string(length) + " differs from earlier chunk length " + std::to_string(*uniform));
    }
    placement.part_number = ToPartNumber(offset / length);
  } else if (uniform) {
    if (offset % *uniform != 0) {
      throw util::InvalidChunk("final chunk offset " + std::to_string(offset) + " is not a multiple of chunk length " + std::to_string(*uniform));
    }
    placement.part_number = ToPartNumber(offset / *uniform);
  } else if (offset == 0) {
    placement.part_number = 1;
  } else {
    // The final chunk may be short, so its own length says nothing about the
    // size of the chunks before it.
    throw util::InvalidChunk("final chunk " + Range(offset, length) + " arrived before the chunk length is known; send earlier chunks first");
  }

  for (const auto& part : parts) {
    if (part.part_number == placement.part_number) {
      if (part.offset != offset || part.length != length) {
        throw util::InvalidChunk("part " + std::to_string(part.part_number) + " was recorded as " + Range(part.offset, part.length) +
                                 ", not " + Range(offset, length));
      }
      placement.replaces_existing = true;
      continue;
    }
    const bool overlaps = part.offset < offset + length && offset < part.offset + part.length;
    if (overlaps) {
      throw util::InvalidChunk("chunk " + Range(offset, length) + " overlaps part " + std::to_string(part.part_number));
    }
  }
  return placement;
}

uint64_t ContiguousPrefix(const std::vector<db::model::PartRecord>& parts) {
  std::vector<const db::model::PartRecord*> ordered;
  ordered.reserve(parts.size());
  for (const auto& part : parts) {
    ordered.push_back(&part);
  }
  std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) { return a->offset < b->offset; });

  uint64_t end = 0;
  for (const auto* part : ordered) {
    if (part->offset != end) {
      break;
    }
    end = part->offset + part->length;
  }
  return end;
}

uint64_t ReceivedBytes(const std::vector<db::model::PartRecord>& parts) {
  uint64_t total = 0;
  for (const auto& part : parts) {
    total += part.length;
  }
  return total;
}

} // namespace ingest::core
