#include "envelope_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"

namespace stagegraph::provenance {

using stagegraph::util::FieldIssue;
using stagegraph::util::ParseError;

std::string EncodeEnvelope(const ArtifactEnvelope& envelope) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  ArtifactEnvelope complete = envelope;
  complete.mutable_parameters_used();
  complete.mutable_content();

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(complete, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode envelope for '" + envelope.stage() + "': " + status.ToString());
  }
  return json;
}

ArtifactEnvelope DecodeEnvelope(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  ArtifactEnvelope envelope;
  auto status = google::protobuf::util::JsonStringToMessage(json, &envelope, options);
  if (!status.ok()) {
    throw ParseError("Corrupt envelope", {{"(document)", status.ToString()}});
  }

  std::vector<FieldIssue> issues;
  if (envelope.stage().empty()) issues.push_back({"stage", "is required"});
  if (envelope.timestamp().empty()) issues.push_back({"timestamp", "is required"});
  if (!envelope.has_content()) issues.push_back({"content", "is required"});
  if (envelope.fingerprint().empty()) issues.push_back({"_fingerprint", "is required"});

  if (!issues.empty()) {
    throw ParseError("Corrupt envelope", std::move(issues));
  }
  return envelope;
}

google::protobuf::Struct SentinelContent(const std::string& reason) {
  google::protobuf::Struct content;
  (*content.mutable_fields())["skipped"].set_bool_value(true);
  (*content.mutable_fields())["reason"].set_string_value(reason);
  return content;
}

bool IsSentinel(const ArtifactEnvelope& envelope) {
  const auto& fields = envelope.content().fields();
  auto it = fields.find("skipped");
  return it != fields.end() && it->second.kind_case() == google::protobuf::Value::kBoolValue && it->second.bool_value();
}

} // namespace stagegraph::provenance
