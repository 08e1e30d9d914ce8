#pragma once

#include <string>

#include "config/config.pb.h"

namespace registry::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields left unset in
  the file are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static registry::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(registry::runtime::config::RuntimeConfig* config);
};

} // namespace registry::config
