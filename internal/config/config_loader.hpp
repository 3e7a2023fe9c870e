#pragma once

#include <string>

#include "config/config.pb.h"

namespace runvault::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf with unknown fields
  rejected. The result is validated before it is returned: every
  postgres-backed storage domain needs a connection_uri and the logging
  level must be one spdlog knows.
*/
class ConfigLoader {
 public:
  static runvault::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static runvault::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // Throws std::runtime_error naming the offending field.
  static void Validate(const runvault::runtime::config::RuntimeConfig& config);
};

} // namespace runvault::config
