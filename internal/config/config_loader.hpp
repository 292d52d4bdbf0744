#pragma once

#include <string>

#include "config/config.pb.h"

namespace roster::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  are rejected. Missing blocks are filled with defaults and the result
  is validated; every failure throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static roster::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static roster::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(roster::runtime::config::RuntimeConfig& config);
  static void Validate(const roster::runtime::config::RuntimeConfig& config);
};

} // namespace roster::config
