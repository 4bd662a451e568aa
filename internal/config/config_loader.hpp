#pragma once

#include <string>

#include <yaml-cpp/node/node.h>

#include "config/config.pb.h"

namespace waypoint::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so the schema is
  config.proto and unknown keys are an error. Parsed configs are then
  checked by Validate.
*/
class ConfigLoader {
 public:
  static waypoint::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static waypoint::runtime::config::RuntimeConfig ParseYaml(const std::string& text);

  // Throws util::InvalidArgument for settings the store cannot honor.
  static void Validate(const waypoint::runtime::config::RuntimeConfig& config);

 private:
  static waypoint::runtime::config::RuntimeConfig FromNode(const YAML::Node& yaml);
};

} // namespace waypoint::config
