#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace ingest::util {

// Session, part handle and catalog ids: random v4 UUIDs, lowercase canonical form.

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace ingest::util
