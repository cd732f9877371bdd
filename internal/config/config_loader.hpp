#pragma once

#include <string>

#include "config/config.pb.h"

namespace sportsledger::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars stay strings, unquoted ones that read as a
  number or boolean become one.
*/
class ConfigLoader {
 public:
  static sportsledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static sportsledger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills every zero / empty field with its documented default.
  static sportsledger::runtime::config::RuntimeConfig WithDefaults(sportsledger::runtime::config::RuntimeConfig config);
};

} // namespace sportsledger::config
