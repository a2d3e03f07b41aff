#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace ingest::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static ingest::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  if (yaml.IsNull()) {
    ingest::runtime::config::RuntimeConfig config;
    ConfigLoader::ApplyDefaults(&config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  ingest::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

static void DefaultRetry(ingest::runtime::config::RetryPolicyConfig* policy, uint32_t attempts, uint64_t initial_backoff_ms) {
  if (policy->max_attempts() == 0) policy->set_max_attempts(attempts);
  if (policy->initial_backoff_ms() == 0) policy->set_initial_backoff_ms(initial_backoff_ms);
  if (policy->backoff_multiplier() <= 0.0) policy->set_backoff_multiplier(2.0);
  if (policy->max_backoff_ms() == 0) policy->set_max_backoff_ms(5000);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

ingest::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

ingest::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& content) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(content);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(ingest::runtime::config::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");
  if (server->max_message_bytes() == 0) server->set_max_message_bytes(64u * 1024u * 1024u);

  auto* storage = config->mutable_storage();
  if (storage->root_uri().empty()) storage->set_root_uri("/tmp/layer-ingest");
  if (storage->input_prefix().empty()) storage->set_input_prefix("inputs");
  if (storage->staging_prefix().empty()) storage->set_staging_prefix("multipart");
  if (storage->layer_prefix().empty()) storage->set_layer_prefix("layers");

  // One hour without a chunk marks a session stale; sweep every minute.
  auto* upload = config->mutable_upload();
  if (upload->session_ttl_ms() == 0) upload->set_session_ttl_ms(60ull * 60ull * 1000ull);
  if (upload->reaper_interval_ms() == 0) upload->set_reaper_interval_ms(60ull * 1000ull);

  auto* retry = config->mutable_retry();
  DefaultRetry(retry->mutable_initiate(), 3, 200);
  DefaultRetry(retry->mutable_part_upload(), 3, 200);
  DefaultRetry(retry->mutable_complete(), 3, 500);
  DefaultRetry(retry->mutable_abort(), 3, 500);
  DefaultRetry(retry->mutable_object_io(), 3, 200);
  DefaultRetry(retry->mutable_catalog(), 3, 100);
}

util::RetryPolicy ToRetryPolicy(const ingest::runtime::config::RetryPolicyConfig& config) {
  util::RetryPolicy policy;
  policy.max_attempts    = config.max_attempts() == 0 ? 1 : config.max_attempts();
  policy.initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms());
  policy.multiplier      = config.backoff_multiplier() <= 0.0 ? 1.0 : config.backoff_multiplier();
  policy.max_backoff     = std::chrono::milliseconds(config.max_backoff_ms());
  return policy;
}

} // namespace ingest::config
