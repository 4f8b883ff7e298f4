#pragma once

#include <string>

#include "config/config.pb.h"

namespace digiplayer::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected so typos in the daemon configuration surface at startup.
  Fields left unset are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static digiplayer::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static digiplayer::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(digiplayer::runtime::config::RuntimeConfig* config);
};

} // namespace digiplayer::config
