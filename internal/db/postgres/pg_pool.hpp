#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace ingest::db::postgres {

/*
  Bounded pool of libpqxx connections shared by PgRepository.

  - Each transaction holds one connection for its lifetime; a connection is
    never used by two threads at once.
  - Every new connection gets the session, part and layer prepared
    statements before it is handed out.
  - Acquire blocks once max_connections are checked out.
  - A connection returned closed (server restart, network drop) is dropped
    instead of going back to the idle list.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // The returned handle gives the connection back to the pool when released.
  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t LiveConnections();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace ingest::db::postgres
