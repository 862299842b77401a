#pragma once

#include <string>

#include "config/config.pb.h"

namespace canary::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unset fields are
  then filled from Defaults(). The result is passed by value into each
  component constructor.
*/
class ConfigLoader {
 public:
  static canary::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fully populated configuration rooted at the current directory.
  static canary::runtime::config::RuntimeConfig Defaults();

  // Fills every unset/zero field with its default. Idempotent.
  static void ApplyDefaults(canary::runtime::config::RuntimeConfig* config);
};

} // namespace canary::config
