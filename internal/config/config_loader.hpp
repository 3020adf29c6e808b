#pragma once

#include <string>

#include "config/config.pb.h"

namespace roster::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static roster::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static roster::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace roster::config
