#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace ingest::core {
class ChunkReceiver;
}
namespace ingest::reaper {
class StaleSessionReaper;
}

namespace ingest::factory {

/*
  Application

  Owns every long-lived component of the server. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<core::ChunkReceiver>         receiver;
  std::shared_ptr<reaper::StaleSessionReaper>  reaper;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Constructs the entire backend from the runtime config.

  This is the composition root of the application and the only place that
  knows concrete repository, storage and converter types. The reaper is
  built but not started.
*/
Application Build(const ingest::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const ingest::runtime::config::DatabaseConfig& database);

} // namespace ingest::factory
