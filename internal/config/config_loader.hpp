#pragma once

#include <string>

#include "config/config.pb.h"

namespace datastream::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; missing optional sections receive defaults.
*/
class ConfigLoader {
 public:
  static datastream::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static datastream::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace datastream::config
