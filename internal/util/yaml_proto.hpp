#pragma once

#include <google/protobuf/struct.pb.h>
#include <yaml-cpp/yaml.h>

namespace stagegraph::util {

/*
  YAML -> google.protobuf.Value conversion.

  Shared by the config loader (YAML -> JSON -> message) and the
  definition parser (stage parameter maps).

  Plain scalars are typed: true/false become bools, anything strtod
  fully consumes becomes a number, the rest are strings. Quoted scalars
  always stay strings.
*/
void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// Requires a YAML map; throws std::runtime_error otherwise.
google::protobuf::Struct YamlToProtoStruct(const YAML::Node& node);

} // namespace stagegraph::util
