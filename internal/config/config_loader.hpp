#pragma once

#include <string>

#include "config/config.pb.h"

namespace alerts::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields left unset
  in the file get the defaults from ApplyDefaults.
*/
class ConfigLoader {
 public:
  static alerts::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(alerts::runtime::config::RuntimeConfig* config);
};

} // namespace alerts::config
