#include "yaml_proto.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace stagegraph::util {

// [-+]? (\.digits | digits (\.digits?)?) ([eE][-+]?digits)?
// Hex, octal, "inf" and "nan" stay strings.
static bool IsDecimalNumber(const std::string& text) {
  auto digit = [](char c) { return c >= '0' && c <= '9'; };

  std::size_t i = 0;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;

  std::size_t mantissa_digits = 0;
  while (i < text.size() && digit(text[i])) {
    ++i;
    ++mantissa_digits;
  }
  if (i < text.size() && text[i] == '.') {
    ++i;
    while (i < text.size() && digit(text[i])) {
      ++i;
      ++mantissa_digits;
    }
  }
  if (mantissa_digits == 0) return false;

  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;
    std::size_t exponent_digits = 0;
    while (i < text.size() && digit(text[i])) {
      ++i;
      ++exponent_digits;
    }
    if (exponent_digits == 0) return false;
  }
  return i == text.size();
}

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // "!" is the non-specific tag yaml-cpp assigns to quoted scalars
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (IsDecimalNumber(scalar_value)) {
    const double numeric_value = strtod(scalar_value.c_str(), nullptr);
    if (std::isfinite(numeric_value)) {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

google::protobuf::Struct YamlToProtoStruct(const YAML::Node& node) {
  if (!node.IsMap()) {
    throw std::runtime_error("expected a YAML mapping");
  }

  google::protobuf::Value value;
  YamlToProtoValue(node, &value);
  return value.struct_value();
}

} // namespace stagegraph::util
