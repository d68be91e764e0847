#pragma once

#include <string>

#include "config/config.pb.h"

namespace netsweep::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the proto
  schema is the single definition of what the file may contain.
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static netsweep::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static netsweep::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace netsweep::config
