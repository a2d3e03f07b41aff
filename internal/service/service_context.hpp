#pragma once

#include <memory>

namespace ingest::core {
class ChunkReceiver;
}
namespace ingest::db {
class Repository;
}

namespace ingest::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<ingest::core::ChunkReceiver> receiver;
  std::shared_ptr<ingest::db::Repository>      repository;
};

} // namespace ingest::service
