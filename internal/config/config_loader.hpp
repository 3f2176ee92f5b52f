#pragma once

#include <string>

#include "stagegraph/config/v1/config.pb.h"

namespace stagegraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the .proto
  file is the only schema. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static stagegraph::config::v1::RuntimeConfig LoadFromYaml(const std::string& path);
  static stagegraph::config::v1::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // Memory store, info logging, ./sessions and ./manifests.
  static stagegraph::config::v1::RuntimeConfig Defaults();
};

} // namespace stagegraph::config
