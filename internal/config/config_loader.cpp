#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/util/yaml_proto.hpp"

namespace stagegraph::config {

using stagegraph::config::v1::RuntimeConfig;

namespace {

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  if (yaml.IsNull()) {
    return ConfigLoader::Defaults();
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  stagegraph::util::YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + to_json_status.ToString());
  }

  RuntimeConfig config = ConfigLoader::Defaults();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  RuntimeConfig parsed;
  auto status = google::protobuf::util::JsonStringToMessage(json, &parsed, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + status.ToString());
  }

  // Explicit sections replace defaults wholesale.
  if (parsed.has_logging()) {
    *config.mutable_logging() = parsed.logging();
  }
  if (parsed.has_store()) {
    *config.mutable_store() = parsed.store();
  }
  if (parsed.has_session()) {
    *config.mutable_session() = parsed.session();
  }
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  config.mutable_logging()->set_level("info");
  config.mutable_store()->mutable_memory();
  config.mutable_session()->set_base_path("sessions");
  config.mutable_session()->set_manifests_dir("manifests");
  return config;
}

} // namespace stagegraph::config
