#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/catalog_entry_record.hpp"
#include "internal/db/model/part_record.hpp"
#include "internal/db/model/upload_session_record.hpp"
#include "internal/db/sql/schema.hpp"

#if INGEST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if INGEST_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using ingest::db::ErrorCode;
using ingest::db::Repository;
using ingest::db::memory::MemoryRepository;
using ingest::db::model::CatalogEntryRecord;
using ingest::db::model::PartRecord;
using ingest::db::model::UploadSessionRecord;
using ingest::v1::LAYER_KIND_CLIMATE;
using ingest::v1::UPLOAD_STATE_ABORTED;
using ingest::v1::UPLOAD_STATE_COMPLETING;
using ingest::v1::UPLOAD_STATE_FINALIZED;
using ingest::v1::UPLOAD_STATE_RECEIVING;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

UploadSessionRecord MakeSession(const std::string& id, uint64_t last_activity_ms) {
  UploadSessionRecord session;
  session.id                  = id;
  session.total_length        = 300;
  session.content_type        = "image/tiff";
  session.owner               = "integration";
  session.storage_key         = "inputs/" + id;
  session.upload_handle       = "handle-" + id;
  session.state               = UPLOAD_STATE_RECEIVING;
  session.created_at_ms       = last_activity_ms;
  session.last_activity_at_ms = last_activity_ms;
  session.version             = 1;
  return session;
}

CatalogEntryRecord MakeLayer(const std::string& id, const std::string& layer_name) {
  CatalogEntryRecord entry;
  entry.id             = id;
  entry.layer_name     = layer_name;
  entry.kind           = LAYER_KIND_CLIMATE;
  entry.crop           = "whea";
  entry.water_model    = "r";
  entry.climate_model  = "hadgem2-es";
  entry.scenario       = "rcp8p5";
  entry.variable       = "prod";
  entry.year           = 2030;
  entry.filename       = layer_name + ".tif";
  entry.storage_key    = "layers/" + layer_name + "/" + id + ".tif";
  entry.byte_size      = 300;
  entry.min_value      = 1.0;
  entry.max_value      = 9.0;
  entry.global_average = 4.5;
  entry.enabled        = true;
  entry.uploaded_at_ms = NowMs();
  return entry;
}

void VerifySessionLifecycle(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  auto session            = MakeSession(id, NowMs());
  session.declared_name   = "whea_r_hadgem2-es_rcp8p5_prod_2030.tif";
  session.overwrite       = true;
  assert(repo.InsertSession(*tx, session));
  tx->Commit();

  {
    // A failed statement poisons a Postgres transaction; keep it separate.
    auto clash     = repo.Begin();
    auto duplicate = repo.InsertSession(*clash, session);
    assert(!duplicate);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    clash->Rollback();
  }

  tx          = repo.Begin();
  auto loaded = repo.GetSession(*tx, id);
  assert(loaded.has_value());
  assert(loaded->state == UPLOAD_STATE_RECEIVING);
  assert(loaded->total_length == 300);
  assert(loaded->declared_name == session.declared_name);
  assert(loaded->overwrite.has_value() && *loaded->overwrite);
  assert(!loaded->storage_completed);

  loaded->state             = UPLOAD_STATE_COMPLETING;
  loaded->storage_completed = true;
  loaded->last_error        = "conversion failed";
  loaded->version           = 2;
  assert(repo.UpdateSession(*tx, *loaded, 1));

  auto stale = repo.UpdateSession(*tx, *loaded, 1);
  assert(stale.code == ErrorCode::Conflict);

  auto missing = MakeSession(id + "-missing", NowMs());
  assert(repo.UpdateSession(*tx, missing, 1).code == ErrorCode::NotFound);
  tx->Commit();

  auto verify = repo.Begin();
  auto after  = repo.GetSession(*verify, id);
  assert(after.has_value());
  assert(after->state == UPLOAD_STATE_COMPLETING);
  assert(after->storage_completed);
  assert(after->last_error == "conversion failed");
  assert(after->version == 2);
  assert(!repo.GetSession(*verify, id + "-missing").has_value());
  verify->Commit();
}

void VerifyPartReadWrite(Repository& repo, const std::string& session_id) {
  auto tx = repo.Begin();
  assert(repo.InsertSession(*tx, MakeSession(session_id, NowMs())));

  // Inserted out of order; listing is by part number.
  assert(repo.UpsertPart(*tx, PartRecord{session_id, 3, 200, 100, "tag-c", NowMs()}));
  assert(repo.UpsertPart(*tx, PartRecord{session_id, 1, 0, 100, "tag-a", NowMs()}));
  assert(repo.UpsertPart(*tx, PartRecord{session_id, 2, 100, 100, "tag-b", NowMs()}));

  // Re-sent chunk replaces the part in place.
  assert(repo.UpsertPart(*tx, PartRecord{session_id, 2, 100, 100, "tag-b2", NowMs()}));
  tx->Commit();

  {
    auto read  = repo.Begin();
    auto parts = repo.ListParts(*read, session_id);
    assert(parts.size() == 3);
    assert(parts[0].part_number == 1 && parts[0].offset == 0);
    assert(parts[1].part_number == 2 && parts[1].storage_tag == "tag-b2");
    assert(parts[2].part_number == 3 && parts[2].offset == 200 && parts[2].length == 100);
    assert(repo.ListParts(*read, session_id + "-other").empty());
    read->Commit();
  }

  auto cleanup = repo.Begin();
  assert(repo.DeleteParts(*cleanup, session_id));
  assert(repo.ListParts(*cleanup, session_id).empty());
  cleanup->Commit();
}

void VerifyStaleListing(Repository& repo, const std::string& prefix) {
  const uint64_t now    = NowMs();
  const uint64_t old    = now - 10ull * 60ull * 1000ull;
  const uint64_t cutoff = now - 60ull * 1000ull;

  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession(prefix + "-old", old)));
    assert(repo.InsertSession(*tx, MakeSession(prefix + "-fresh", now)));

    auto finalized  = MakeSession(prefix + "-finalized", old);
    finalized.state = UPLOAD_STATE_FINALIZED;
    assert(repo.InsertSession(*tx, finalized));

    auto aborted  = MakeSession(prefix + "-aborted", old);
    aborted.state = UPLOAD_STATE_ABORTED;
    assert(repo.InsertSession(*tx, aborted));

    auto completing  = MakeSession(prefix + "-completing", old - 1);
    completing.state = UPLOAD_STATE_COMPLETING;
    assert(repo.InsertSession(*tx, completing));
    tx->Commit();
  }

  auto tx    = repo.Begin();
  auto stale = repo.ListStaleSessions(*tx, cutoff);
  tx->Commit();

  bool saw_old        = false;
  bool saw_completing = false;
  for (const auto& session : stale) {
    assert(session.id != prefix + "-fresh");
    assert(session.id != prefix + "-finalized");
    assert(session.id != prefix + "-aborted");
    saw_old        = saw_old || session.id == prefix + "-old";
    saw_completing = saw_completing || session.id == prefix + "-completing";
  }
  assert(saw_old);
  assert(saw_completing);
}

void VerifyLayerCatalog(Repository& repo, const std::string& prefix) {
  const std::string layer_name = prefix + "_whea_r_hadgem2-es_rcp8p5_prod_2030";

  {
    auto tx = repo.Begin();
    assert(!repo.FindLayerByName(*tx, layer_name).has_value());
    assert(repo.InsertLayer(*tx, MakeLayer(prefix + "-layer-1", layer_name)));
    assert(!tx->IsCommitted());
    tx->Commit();
    assert(tx->IsCommitted());
  }

  {
    auto tx    = repo.Begin();
    auto clash = repo.InsertLayer(*tx, MakeLayer(prefix + "-layer-2", layer_name));
    assert(!clash);
    assert(clash.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx    = repo.Begin();
    auto found = repo.FindLayerByName(*tx, layer_name);
    assert(found.has_value());
    assert(found->id == prefix + "-layer-1");
    assert(found->kind == LAYER_KIND_CLIMATE);
    assert(found->crop == "whea");
    assert(found->year == 2030);
    assert(found->min_value == 1.0 && found->max_value == 9.0);
    assert(found->global_average == 4.5);
    assert(found->enabled);

    // Overwrite replaces the entry under the same name.
    assert(repo.DeleteLayer(*tx, found->id));
    assert(repo.InsertLayer(*tx, MakeLayer(prefix + "-layer-3", layer_name)));
    tx->Commit();
  }

  auto tx    = repo.Begin();
  auto found = repo.FindLayerByName(*tx, layer_name);
  assert(found.has_value());
  assert(found->id == prefix + "-layer-3");
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession(id, NowMs())));
    assert(repo.UpsertPart(*tx, PartRecord{id, 1, 0, 100, "tag", NowMs()}));
    assert(repo.InsertLayer(*tx, MakeLayer(id + "-layer", id + "_layer")));
    tx->Rollback();
    assert(!tx->IsCommitted());
  }

  {
    // Destroyed without Commit.
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession(id + "-dropped", NowMs())));
  }

  auto tx = repo.Begin();
  assert(!repo.GetSession(*tx, id).has_value());
  assert(!repo.GetSession(*tx, id + "-dropped").has_value());
  assert(repo.ListParts(*tx, id).empty());
  assert(!repo.FindLayerByName(*tx, id + "_layer").has_value());
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession(id, NowMs())));
    tx->Commit();
  }

  if (supports_parallel_transactions) {
    auto tx1 = repo.Begin();
    auto tx2 = repo.Begin();

    auto r1 = repo.GetSession(*tx1, id);
    auto r2 = repo.GetSession(*tx2, id);
    assert(r1.has_value() && r2.has_value());

    r1->version = 2;
    assert(repo.UpdateSession(*tx1, *r1, 1));
    tx1->Commit();

    r2->version = 2;
    auto lost = repo.UpdateSession(*tx2, *r2, 1);
    assert(lost.code == ErrorCode::Conflict);
    tx2->Rollback();
  } else {
    // Writers are serialized; a stale version is still rejected.
    std::optional<UploadSessionRecord> snapshot;
    {
      auto tx  = repo.Begin();
      snapshot = repo.GetSession(*tx, id);
      tx->Commit();
    }
    assert(snapshot.has_value());

    {
      auto tx      = repo.Begin();
      auto current = repo.GetSession(*tx, id);
      current->version = 2;
      assert(repo.UpdateSession(*tx, *current, 1));
      tx->Commit();
    }

    auto tx         = repo.Begin();
    snapshot->version = 2;
    assert(repo.UpdateSession(*tx, *snapshot, 1).code == ErrorCode::Conflict);
    tx->Rollback();
  }

  // Racing writers: each CAS from the version it read, retrying on Conflict.
  constexpr int            kThreads = 4;
  constexpr int            kBumps   = 10;
  std::atomic<int>         conflicts{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < kThreads; ++i) {
    workers.emplace_back([&repo, &id, &conflicts]() {
      for (int bump = 0; bump < kBumps;) {
        auto tx      = repo.Begin();
        auto current = repo.GetSession(*tx, id);
        assert(current.has_value());
        const uint64_t expected = current->version;
        current->version        = expected + 1;
        auto result             = repo.UpdateSession(*tx, *current, expected);
        if (!result) {
          assert(result.code == ErrorCode::Conflict);
          conflicts.fetch_add(1);
          tx->Rollback();
          continue;
        }
        tx->Commit();
        ++bump;
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  auto verify = repo.Begin();
  auto final  = repo.GetSession(*verify, id);
  assert(final.has_value());
  assert(final->version == 2 + kThreads * kBumps);
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();

    auto session              = MakeSession(id, NowMs());
    session.state             = UPLOAD_STATE_COMPLETING;
    session.storage_completed = true;
    session.declared_name     = "whea_r_hadgem2-es_rcp8p5_prod_2030.tif";
    session.version           = 7;
    assert(repo->InsertSession(*tx, session));
    assert(repo->UpsertPart(*tx, PartRecord{id, 1, 0, 300, "tag-durable", NowMs()}));
    assert(repo->InsertLayer(*tx, MakeLayer(id + "-layer", id + "_layer")));

    tx->Commit();
  }

  backend.restart(repo);

  auto tx      = repo->Begin();
  auto session = repo->GetSession(*tx, id);
  assert(session.has_value());
  assert(session->version == 7);
  assert(session->state == UPLOAD_STATE_COMPLETING);
  assert(session->storage_completed);
  assert(!session->overwrite.has_value());

  auto parts = repo->ListParts(*tx, id);
  assert(parts.size() == 1);
  assert(parts[0].storage_tag == "tag-durable");

  auto layer = repo->FindLayerByName(*tx, id + "_layer");
  assert(layer.has_value());
  assert(layer->storage_key == "layers/" + id + "_layer/" + id + "-layer.tif");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = false,
  };
}

#if INGEST_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = (std::filesystem::temp_directory_path() / ("layer_ingest_parity_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<ingest::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : ingest::db::sql::SqliteSchema()) {
      db->Exec(sql);
    }
    return std::make_shared<ingest::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if INGEST_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("INGEST_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("INGEST_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<ingest::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const auto& sql : ingest::db::sql::PostgresSchema()) {
        tx.exec(sql);
      }
      tx.commit();
    }
    return std::make_shared<ingest::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  // Shared databases keep rows from earlier runs.
  const std::string run = backend.name + "-" + std::to_string(NowMs());
  auto              repo = backend.make_repository();

  VerifySessionLifecycle(*repo, run + "-session");
  VerifyPartReadWrite(*repo, run + "-parts");
  VerifyStaleListing(*repo, run + "-stale");
  VerifyLayerCatalog(*repo, run);
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyConcurrentUpdates(*repo, run + "-concurrency", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if INGEST_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if INGEST_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "layer_ingest_integration_repository_parity: pass\n";
  return 0;
}
