#pragma once

#include <string>

#include "config/config.pb.h"

namespace collector::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  an error. Unset values receive their defaults and the result is
  validated. Every failure throws util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static collector::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static collector::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(collector::runtime::config::RuntimeConfig* config);
  static void Validate(const collector::runtime::config::RuntimeConfig& config);
};

} // namespace collector::config
