#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace ingest::util {

/*
  Explicit retry policy attached to an outbound call.

  max_attempts counts the first call; 1 means no retry. Backoff before
  attempt n (n >= 2) is initial_backoff * multiplier^(n-2), capped at
  max_backoff when that is non-zero.
*/
struct RetryPolicy {
  uint32_t                  max_attempts{1};
  std::chrono::milliseconds initial_backoff{0};
  double                    multiplier{2.0};
  std::chrono::milliseconds max_backoff{0};

  std::chrono::milliseconds BackoffBefore(uint32_t attempt) const {
    if (attempt < 2 || initial_backoff.count() == 0) {
      return std::chrono::milliseconds{0};
    }
    double delay = static_cast<double>(initial_backoff.count());
    for (uint32_t i = 2; i < attempt; ++i) {
      delay *= multiplier;
    }
    auto result = std::chrono::milliseconds(static_cast<int64_t>(delay));
    if (max_backoff.count() > 0) {
      result = std::min(result, max_backoff);
    }
    return result;
  }
};

using RetryPredicate = std::function<bool(const std::exception&)>;

inline bool RetryAny(const std::exception&) {
  return true;
}

/*
  Runs fn under the policy. Exceptions for which should_retry returns false
  are rethrown immediately; the last exception is rethrown when attempts run
  out.
*/
template <typename Fn>
auto WithRetry(const RetryPolicy& policy, std::string_view operation, Fn&& fn, const RetryPredicate& should_retry = RetryAny)
    -> std::invoke_result_t<Fn> {
  const uint32_t attempts = std::max<uint32_t>(policy.max_attempts, 1);
  for (uint32_t attempt = 1;; ++attempt) {
    const auto delay = policy.BackoffBefore(attempt);
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    try {
      return fn();
    } catch (const std::exception& ex) {
      if (attempt >= attempts || !should_retry(ex)) {
        throw;
      }
      INGEST_LOG_WARN("Retrying outbound call", {observability::StringField("operation", operation),
                                                 observability::IntField("attempt", attempt),
                                                 observability::StringField("error", ex.what())});
    }
  }
}

} // namespace ingest::util
