#pragma once

#include <string>

#include "config/config.pb.h"

namespace rollout::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Missing sections receive defaults and the result is validated;
  any problem surfaces as std::runtime_error("Invalid configuration: ...").
*/
class ConfigLoader {
 public:
  static rollout::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static rollout::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(rollout::runtime::config::RuntimeConfig* config);
  static void Validate(const rollout::runtime::config::RuntimeConfig& config);
};

} // namespace rollout::config
