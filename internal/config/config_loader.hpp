#pragma once

#include <string>

#include "config/config.pb.h"

namespace portwatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  an error. The result has already been through Validate().
*/
class ConfigLoader {
 public:
  static portwatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static portwatch::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset fields with defaults and rejects out-of-range values.
  static void Validate(portwatch::runtime::config::RuntimeConfig& config);
};

} // namespace portwatch::config
