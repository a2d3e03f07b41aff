#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/db/api/repository.hpp"

namespace ingest::core {
class ChunkReceiver;
}

namespace ingest::reaper {

/*
  Background worker that expires idle upload sessions.

  Every interval it lists non-terminal sessions whose last activity is older
  than the TTL and aborts each one through the receiver, which releases the
  storage side (multipart abort or raw object removal).
*/
class StaleSessionReaper {
 public:
  StaleSessionReaper(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::ChunkReceiver> receiver, std::chrono::milliseconds ttl,
                     std::chrono::milliseconds interval);
  ~StaleSessionReaper();

  void Start();
  void Stop();

  // One sweep; returns the number of sessions expired.
  uint64_t RunOnce();

 private:
  void Run();

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<core::ChunkReceiver> receiver_;
  std::chrono::milliseconds            ttl_;
  std::chrono::milliseconds            interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
};

} // namespace ingest::reaper
