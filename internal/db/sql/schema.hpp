#pragma once

#include <string>
#include <vector>

namespace ingest::db::sql {

/*
  Bootstrap DDL, applied in order at startup. Every statement is idempotent.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS upload_session (id TEXT PRIMARY KEY, total_length INTEGER NOT NULL, content_type TEXT NOT NULL, owner TEXT NOT NULL, "
      "storage_key TEXT NOT NULL, upload_handle TEXT NOT NULL, state INTEGER NOT NULL, declared_name TEXT NOT NULL, overwrite INTEGER, "
      "storage_completed INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, last_activity_at_ms INTEGER NOT NULL, version INTEGER NOT NULL, "
      "last_error TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS upload_session_activity ON upload_session(state, last_activity_at_ms);",
      "CREATE TABLE IF NOT EXISTS upload_part (session_id TEXT NOT NULL REFERENCES upload_session(id) ON DELETE CASCADE, part_number INTEGER NOT NULL, "
      "byte_offset INTEGER NOT NULL, length INTEGER NOT NULL, storage_tag TEXT NOT NULL, received_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (session_id, part_number));",
      "CREATE TABLE IF NOT EXISTS layer (id TEXT PRIMARY KEY, layer_name TEXT NOT NULL UNIQUE, kind INTEGER NOT NULL, crop TEXT NOT NULL, "
      "water_model TEXT NOT NULL, climate_model TEXT NOT NULL, scenario TEXT NOT NULL, variable TEXT NOT NULL, year INTEGER NOT NULL, "
      "filename TEXT NOT NULL, storage_key TEXT NOT NULL, byte_size INTEGER NOT NULL, min_value REAL NOT NULL, max_value REAL NOT NULL, "
      "global_average REAL NOT NULL, enabled INTEGER NOT NULL, uploaded_at_ms INTEGER NOT NULL);"};
  return kStatements;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS upload_session (id TEXT PRIMARY KEY, total_length BIGINT NOT NULL, content_type TEXT NOT NULL, owner TEXT NOT NULL, "
      "storage_key TEXT NOT NULL, upload_handle TEXT NOT NULL, state SMALLINT NOT NULL, declared_name TEXT NOT NULL, overwrite BOOLEAN, "
      "storage_completed BOOLEAN NOT NULL, created_at_ms BIGINT NOT NULL, last_activity_at_ms BIGINT NOT NULL, version BIGINT NOT NULL, "
      "last_error TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS upload_session_activity ON upload_session(state, last_activity_at_ms);",
      "CREATE TABLE IF NOT EXISTS upload_part (session_id TEXT NOT NULL REFERENCES upload_session(id) ON DELETE CASCADE, part_number INTEGER NOT NULL, "
      "byte_offset BIGINT NOT NULL, length BIGINT NOT NULL, storage_tag TEXT NOT NULL, received_at_ms BIGINT NOT NULL, "
      "PRIMARY KEY (session_id, part_number));",
      "CREATE TABLE IF NOT EXISTS layer (id TEXT PRIMARY KEY, layer_name TEXT NOT NULL UNIQUE, kind SMALLINT NOT NULL, crop TEXT NOT NULL, "
      "water_model TEXT NOT NULL, climate_model TEXT NOT NULL, scenario TEXT NOT NULL, variable TEXT NOT NULL, year INTEGER NOT NULL, "
      "filename TEXT NOT NULL, storage_key TEXT NOT NULL, byte_size BIGINT NOT NULL, min_value DOUBLE PRECISION NOT NULL, "
      "max_value DOUBLE PRECISION NOT NULL, global_average DOUBLE PRECISION NOT NULL, enabled BOOLEAN NOT NULL, uploaded_at_ms BIGINT NOT NULL);"};
  return kStatements;
}

} // namespace ingest::db::sql
