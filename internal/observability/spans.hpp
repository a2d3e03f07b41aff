#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ingest::runtime::config {
class RuntimeConfig;
}

namespace ingest::observability {

/*
  OTLP export is driven by the observability section of RuntimeConfig.
  Both initializers return false (and install nothing) when the matching
  *_enabled flag is off or the build has no OpenTelemetry.
*/
bool InitializeTracing(const ingest::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const ingest::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Span attribute key carrying the upload session id.
inline constexpr std::string_view kSessionAttribute = "ingest.session_id";

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetSession(std::string_view session_id) {
    SetAttribute(kSessionAttribute, session_id);
  }
  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void AddChunkBytes(std::uint64_t bytes);
  void ObserveFinalizeDurationMs(std::string_view outcome, double duration_ms);
  void RecordSessionsReaped(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const ingest::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const ingest::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::AddChunkBytes(std::uint64_t) {
}

inline void Metrics::ObserveFinalizeDurationMs(std::string_view, double) {
}

inline void Metrics::RecordSessionsReaped(std::uint64_t) {
}
#endif

} // namespace ingest::observability
