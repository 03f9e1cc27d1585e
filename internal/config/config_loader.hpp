#pragma once

#include <string>

#include "config/config.pb.h"

namespace convintel::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static convintel::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static convintel::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace convintel::config
