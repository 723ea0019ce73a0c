#pragma once

#include <string>

#include "config/config.pb.h"

namespace pmm::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static pmm::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Defaults used when no config file is given.
  static pmm::runtime::config::RuntimeConfig Defaults();
};

} // namespace pmm::config
