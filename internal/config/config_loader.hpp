#pragma once

#include <string>

#include "config/config.pb.h"

namespace piecework::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Scalars under string fields stay strings whether quoted or
  not, so daily_target: 1.50 keeps its exact text.
*/
class ConfigLoader {
 public:
  static piecework::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static piecework::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace piecework::config
