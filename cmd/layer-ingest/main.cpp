#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reaper/stale_session_reaper.hpp"
#include "internal/runtime/server.hpp"

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

struct Options {
  std::string config_path;
  bool        check_only = false;
};

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      options.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (options.config_path.empty()) return std::nullopt;
  return options;
}

// Flushes logs and exporters however main exits.
struct TelemetryGuard {
  ~TelemetryGuard() {
    ingest::observability::ShutdownLogging();
    ingest::observability::ShutdownMetrics();
    ingest::observability::ShutdownTracing();
  }
};

const char* BackendName(const ingest::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) return "sqlite";
  if (database.has_postgres()) return "postgres";
  return "memory";
}

} // namespace

int main(int argc, char** argv) {
  auto options = ParseArgs(argc, argv);
  if (!options) {
    std::cerr << "Usage: layer-ingest [--check-config] <config.yaml> | layer-ingest [--check-config] --config <config.yaml>" << std::endl;
    return 1;
  }

  ingest::runtime::config::RuntimeConfig config;
  try {
    config = ingest::config::ConfigLoader::LoadFromYaml(options->config_path);
  } catch (const std::exception& e) {
    std::cerr << "layer-ingest: " << e.what() << std::endl;
    return 1;
  }
  if (options->check_only) {
    std::cout << options->config_path << ": ok (database=" << BackendName(config.database())
              << ", storage=" << config.storage().root_uri() << ")" << std::endl;
    return 0;
  }

  ingest::observability::InitializeTracing(config);
  ingest::observability::InitializeMetrics(config);
  ingest::observability::InitializeLogging(config);
  TelemetryGuard telemetry;

  try {
    auto app = ingest::factory::Build(config);

    ingest::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services),
                                   static_cast<int>(config.server().max_message_bytes()));

    // Handlers go in before Start so an early signal is not lost.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.reaper->Start();
    INGEST_LOG_INFO("Layer ingest started", {ingest::observability::StringField("bind_address", config.server().bind_address()),
                                             ingest::observability::StringField("database", BackendName(config.database())),
                                             ingest::observability::StringField("storage_root", config.storage().root_uri())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    INGEST_LOG_INFO("Shutting down layer ingest");
    app.reaper->Stop();
    server.Stop();
  } catch (const std::exception& e) {
    INGEST_LOG_ERROR("Fatal error", {ingest::observability::StringField("error", e.what())});
    return 2;
  }

  return 0;
}
