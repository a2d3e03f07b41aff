#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace ingest::observability::detail {

inline constexpr const char* kServiceVersion = "0.1.0";

// Exporter settings shared by the trace and metric pipelines.
struct OtlpSettings {
  std::string service_name;
  std::string environment;
  std::string endpoint;
  bool        http    = false;
  bool        use_tls = false;
};

/*
  Endpoint precedence: config, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  then OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the
  transport. signal is "TRACES" or "METRICS"; http_path the matching
  OTLP/HTTP path.
*/
inline OtlpSettings ResolveOtlpSettings(const ingest::runtime::config::ObservabilityConfig& config, const std::string& signal,
                                        const std::string& http_path) {
  OtlpSettings settings;
  settings.service_name = config.service_name().empty() ? "layer-ingest" : config.service_name();
  settings.environment  = config.environment();
  settings.http         = config.transport() == ingest::runtime::config::OTLP_TRANSPORT_HTTP;
  settings.use_tls      = config.use_tls();

  if (!config.otlp_endpoint().empty()) {
    settings.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(("OTEL_EXPORTER_OTLP_" + signal + "_ENDPOINT").c_str())) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else {
    settings.endpoint = settings.http ? "http://localhost:4318" + http_path : "localhost:4317";
  }
  return settings;
}

inline opentelemetry::sdk::resource::Resource BuildResource(const OtlpSettings& settings) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", settings.service_name},
                                                            {"service.version", std::string(kServiceVersion)}};
  if (!settings.environment.empty()) {
    attrs.SetAttribute("deployment.environment", settings.environment);
  }
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace ingest::observability::detail

#endif
