#pragma once

#include <string>

#include "config/config.pb.h"

namespace heroes::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Quoted scalars stay
  strings, so keys such as "11111111111111111111111111111111" are not read
  as numbers. Defaults are applied and the result validated; every failure
  throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static heroes::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(heroes::runtime::config::RuntimeConfig& config);
  static void Validate(const heroes::runtime::config::RuntimeConfig& config);
};

} // namespace heroes::config
