#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace ingest::core {

/*
  Converts a non-OK repository result into the service error hierarchy.
*/
inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
    case db::ErrorCode::Busy:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message + " (" + db::ToString(result.code) + ")");
  }
}

} // namespace ingest::core
