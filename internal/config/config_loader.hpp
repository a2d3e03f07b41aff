#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/util/retry.hpp"

namespace ingest::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset values are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static ingest::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static ingest::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(ingest::runtime::config::RuntimeConfig* config);
};

util::RetryPolicy ToRetryPolicy(const ingest::runtime::config::RetryPolicyConfig& config);

} // namespace ingest::config
