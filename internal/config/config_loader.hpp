#pragma once

#include <string>

#include "config/config.pb.h"

namespace x402::config {

/*
  Loads RuntimeConfig from YAML file.

  The YAML sections are rendered as JSON and parsed into the protobuf
  message, so unknown sections or keys are rejected. An empty document
  yields a default RuntimeConfig.
*/
class ConfigLoader {
 public:
  static x402::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static x402::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace x402::config
