#pragma once

#include <string>

#include "config/config.pb.h"

namespace ticketflow::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys
  are rejected so that typos surface at startup.
*/
class ConfigLoader {
 public:
  static ticketflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static ticketflow::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace ticketflow::config
