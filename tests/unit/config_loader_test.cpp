#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "layer_ingest_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\ingest\\\"quoted\"\\db.sqlite"
)");

  auto config = ingest::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\ingest\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  auto config = ingest::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ingest::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestDefaultsFillMissingSections() {
  auto config = ingest::config::ConfigLoader::LoadFromYamlString("{}");
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.server().max_message_bytes() == 64u * 1024u * 1024u);
  assert(config.storage().input_prefix() == "inputs");
  assert(config.storage().staging_prefix() == "multipart");
  assert(config.storage().layer_prefix() == "layers");
  assert(config.upload().session_ttl_ms() == 3600000u);
  assert(config.upload().reaper_interval_ms() == 60000u);
  assert(!config.upload().overwrite_duplicates());
  assert(config.retry().part_upload().max_attempts() == 3);
  assert(config.retry().initiate().max_attempts() == 3);
  assert(config.retry().initiate().initial_backoff_ms() == 200);
  assert(config.retry().catalog().initial_backoff_ms() == 100);
  assert(!config.database().has_sqlite() && !config.database().has_postgres());
}

void TestUploadStorageAndRetrySections() {
  auto config = ingest::config::ConfigLoader::LoadFromYamlString(R"(storage:
  root_uri: "s3://rasters/ingest"
  s3:
    region: eu-west-1
    endpoint_override: "localhost:9000"
    scheme: http
  retain_raw_inputs: true
upload:
  overwrite_duplicates: true
  session_ttl_ms: 5000
retry:
  complete:
    max_attempts: 7
    initial_backoff_ms: 10
    backoff_multiplier: 3
    max_backoff_ms: 50
vocabulary:
  crops: [wheat, oats]
  years: [2015, 2025]
)");

  assert(config.storage().root_uri() == "s3://rasters/ingest");
  assert(config.storage().s3().region() == "eu-west-1");
  assert(config.storage().retain_raw_inputs());
  assert(config.upload().overwrite_duplicates());
  assert(config.upload().session_ttl_ms() == 5000u);
  assert(config.vocabulary().crops_size() == 2);
  assert(config.vocabulary().years(1) == 2025);

  const auto policy = ingest::config::ToRetryPolicy(config.retry().complete());
  assert(policy.max_attempts == 7);
  assert(policy.BackoffBefore(1) == std::chrono::milliseconds(0));
  assert(policy.BackoffBefore(2) == std::chrono::milliseconds(10));
  assert(policy.BackoffBefore(3) == std::chrono::milliseconds(30));
  assert(policy.BackoffBefore(4) == std::chrono::milliseconds(50));
}

void TestBackendSelection() {
  auto config = ingest::config::ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://ingest@localhost/ingest"
    max_connections: 4
)");
  assert(config.database().has_postgres());
  assert(config.database().postgres().max_connections() == 4);
}

void TestLoggingObservabilityAndSqliteTuning() {
  auto config = ingest::config::ConfigLoader::LoadFromYamlString(R"(logging:
  file: /var/log/layer-ingest.log
observability:
  service_name: layer-ingest-eu
  environment: staging
  use_tls: true
database:
  sqlite:
    path: /var/lib/layer-ingest/ingest.db
    busy_timeout_ms: 250
    full_sync: true
)");
  assert(config.logging().file() == "/var/log/layer-ingest.log");
  assert(config.observability().service_name() == "layer-ingest-eu");
  assert(config.observability().environment() == "staging");
  assert(config.observability().use_tls());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().busy_timeout_ms() == 250u);
  assert(config.database().sqlite().full_sync());
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestDefaultsFillMissingSections();
  TestUploadStorageAndRetrySections();
  TestBackendSelection();
  TestLoggingObservabilityAndSqliteTuning();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
