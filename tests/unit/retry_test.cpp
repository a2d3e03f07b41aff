#include "internal/util/retry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace {

using ingest::util::RetryPolicy;
using ingest::util::WithRetry;

RetryPolicy Attempts(uint32_t attempts) {
  RetryPolicy policy;
  policy.max_attempts = attempts;
  return policy;
}

void TestSucceedsAfterTransientFailures() {
  int  calls  = 0;
  auto result = WithRetry(Attempts(3), "flaky", [&] {
    if (++calls < 3) throw std::runtime_error("transient");
    return 7;
  });
  assert(result == 7);
  assert(calls == 3);
}

void TestRethrowsWhenAttemptsRunOut() {
  int  calls = 0;
  bool threw = false;
  try {
    WithRetry(Attempts(2), "always", [&] {
      ++calls;
      throw std::runtime_error("down");
    });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(calls == 2);
}

void TestPermanentErrorsAreNotRetried() {
  int  calls = 0;
  bool threw = false;
  try {
    WithRetry(
        Attempts(5), "permanent",
        [&] {
          ++calls;
          throw std::invalid_argument("bad key");
        },
        [](const std::exception& e) { return dynamic_cast<const std::invalid_argument*>(&e) == nullptr; });
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(calls == 1);
}

void TestBackoffGrowsAndIsCapped() {
  RetryPolicy policy;
  policy.max_attempts    = 6;
  policy.initial_backoff = std::chrono::milliseconds(100);
  policy.multiplier      = 2.0;
  policy.max_backoff     = std::chrono::milliseconds(350);

  assert(policy.BackoffBefore(1).count() == 0);
  assert(policy.BackoffBefore(2).count() == 100);
  assert(policy.BackoffBefore(3).count() == 200);
  assert(policy.BackoffBefore(4).count() == 350);
  assert(policy.BackoffBefore(6).count() == 350);
}

} // namespace

int main() {
  TestSucceedsAfterTransientFailures();
  TestRethrowsWhenAttemptsRunOut();
  TestPermanentErrorsAreNotRetried();
  TestBackoffGrowsAndIsCapped();

  std::cout << "retry_test: pass\n";
  return 0;
}
