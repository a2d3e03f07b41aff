#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace ingest::runtime::config {
class RuntimeConfig;
}

namespace ingest::observability {

/*
  One key=value pair appended to a log line. Values containing spaces,
  quotes or '=' are quoted so lines stay machine-splittable.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Upload session id; every record about a session carries it under one key.
inline LogField SessionField(std::string_view session_id) {
  return StringField("session_id", session_id);
}

// Console logger named "layer-ingest", plus a file sink when logging.file is set.
void InitializeLogging(const ingest::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace ingest::observability

#define INGEST_LOG_INFO(message, ...) ::ingest::observability::LogInfo((message), ##__VA_ARGS__)
#define INGEST_LOG_WARN(message, ...) ::ingest::observability::LogWarn((message), ##__VA_ARGS__)
#define INGEST_LOG_ERROR(message, ...) ::ingest::observability::LogError((message), ##__VA_ARGS__)
