#pragma once

#include <string>

#include "config/config.pb.h"

namespace acquisition::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. The parsed
  message is validated before it is returned.
*/
class ConfigLoader {
 public:
  static acquisition::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error("Invalid configuration: ...") on the first violation.
  static void Validate(const acquisition::runtime::config::RuntimeConfig& config);
};

} // namespace acquisition::config
