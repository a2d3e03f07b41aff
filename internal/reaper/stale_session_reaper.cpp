#include "stale_session_reaper.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/chunk_receiver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace ingest::reaper {

StaleSessionReaper::StaleSessionReaper(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::ChunkReceiver> receiver,
                                       std::chrono::milliseconds ttl, std::chrono::milliseconds interval)
    : repository_(std::move(repository)), receiver_(std::move(receiver)), ttl_(ttl), interval_(interval) {
  if (!repository_ || !receiver_) {
    throw std::invalid_argument("stale session reaper requires repository and receiver");
  }
}

StaleSessionReaper::~StaleSessionReaper() {
  Stop();
}

void StaleSessionReaper::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&StaleSessionReaper::Run, this);
}

void StaleSessionReaper::Stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

uint64_t StaleSessionReaper::RunOnce() {
  const auto now    = util::NowUnixMillis();
  const auto ttl_ms = static_cast<uint64_t>(ttl_.count());
  const auto cutoff = now > ttl_ms ? now - ttl_ms : 0;

  std::vector<db::model::UploadSessionRecord> stale;
  {
    auto tx = repository_->Begin();
    stale   = repository_->ListStaleSessions(*tx, cutoff);
    tx->Commit();
  }
  if (stale.empty()) {
    return 0;
  }

  observability::SpanScope span("ingest.reaper.sweep");
  span.SetAttribute("candidates", static_cast<int64_t>(stale.size()));

  uint64_t expired = 0;
  for (const auto& session : stale) {
    try {
      if (receiver_->ExpireIfStale(session.id, cutoff)) {
        ++expired;
      }
    } catch (const std::exception& e) {
      INGEST_LOG_WARN("Stale session not expired", {observability::SessionField(session.id),
                                                    observability::StringField("error", e.what())});
    }
  }

  observability::Metrics::Instance().RecordSessionsReaped(expired);
  INGEST_LOG_INFO("Stale sessions swept", {observability::IntField("candidates", static_cast<int64_t>(stale.size())),
                                           observability::IntField("expired", static_cast<int64_t>(expired))});
  return expired;
}

void StaleSessionReaper::Run() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(wake_mutex_);
      wake_.wait_for(lock, interval_, [this] { return !running_; });
    }
    if (!running_) break;

    try {
      RunOnce();
    } catch (const std::exception& e) {
      INGEST_LOG_ERROR("Stale session sweep failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace ingest::reaper
