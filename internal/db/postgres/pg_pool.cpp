#include "pg_pool.hpp"

namespace ingest::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_session",
               "SELECT id,total_length,content_type,owner,storage_key,upload_handle,state,declared_name,overwrite,storage_completed,"
               "created_at_ms,last_activity_at_ms,version,last_error FROM upload_session WHERE id=$1");

  conn.prepare("insert_session",
               "INSERT INTO upload_session(id,total_length,content_type,owner,storage_key,upload_handle,state,declared_name,overwrite,"
               "storage_completed,created_at_ms,last_activity_at_ms,version,last_error) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14)");

  conn.prepare("update_session",
               "UPDATE upload_session SET total_length=$2,content_type=$3,owner=$4,storage_key=$5,upload_handle=$6,state=$7,"
               "declared_name=$8,overwrite=$9,storage_completed=$10,created_at_ms=$11,last_activity_at_ms=$12,version=$13,last_error=$14 "
               "WHERE id=$1 AND version=$15");

  conn.prepare("upsert_part",
               "INSERT INTO upload_part(session_id,part_number,byte_offset,length,storage_tag,received_at_ms) VALUES($1,$2,$3,$4,$5,$6) "
               "ON CONFLICT(session_id,part_number) DO UPDATE SET byte_offset=EXCLUDED.byte_offset,length=EXCLUDED.length,"
               "storage_tag=EXCLUDED.storage_tag,received_at_ms=EXCLUDED.received_at_ms");

  conn.prepare("list_parts",
               "SELECT session_id,part_number,byte_offset,length,storage_tag,received_at_ms FROM upload_part WHERE session_id=$1 "
               "ORDER BY part_number");

  conn.prepare("find_layer_by_name",
               "SELECT id,layer_name,kind,crop,water_model,climate_model,scenario,variable,year,filename,storage_key,byte_size,"
               "min_value,max_value,global_average,enabled,uploaded_at_ms FROM layer WHERE layer_name=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  const bool                        reusable = owned->is_open();
  {
    std::lock_guard lock(mutex_);
    if (reusable) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  cv_.notify_one();
}

std::size_t PgPool::LiveConnections() {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

} // namespace ingest::db::postgres
