#pragma once

#include <string>

#include "config/config.pb.h"

namespace YAML {
class Node;
}

namespace nsi::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected so a typo in a timeout override does not silently fall back to
  the default.
*/
class ConfigLoader {
 public:
  static nsi::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static nsi::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

 private:
  static nsi::runtime::config::RuntimeConfig FromNode(const YAML::Node& node);
};

} // namespace nsi::config
