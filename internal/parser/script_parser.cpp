#include "script_parser.hpp"

#include <unordered_map>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/parser/yaml_schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/yaml_proto.hpp"

namespace stagegraph::parser {

using model::GraphDefinition;
using model::ScriptHeader;
using model::StageNode;

namespace {

struct StageOverride {
  std::string              id;
  std::optional<bool>      skip;
  google::protobuf::Struct parameters;
};

ScriptHeader ReadHeader(const YAML::Node& doc, IssueList& issues) {
  ScriptHeader header;
  header.name        = ReadString(doc, "name", "", issues).value_or("");
  header.description = ReadString(doc, "description", "", issues).value_or("");
  header.manifest    = ReadRequiredString(doc, "manifest", "", issues).value_or("");
  header.version     = ReadString(doc, "version", "", issues).value_or("1.0.0");
  header.authors     = ReadString(doc, "authors", "", issues).value_or("");
  return header;
}

std::vector<StageOverride> ReadOverrides(const YAML::Node& doc, IssueList& issues) {
  std::vector<StageOverride> overrides;

  const YAML::Node stages = doc["stages"];
  if (!stages.IsDefined() || stages.IsNull()) {
    return overrides;
  }
  if (!stages.IsSequence()) {
    issues.Add("stages", "expected a list of stage overrides");
    return overrides;
  }

  for (std::size_t i = 0; i < stages.size(); ++i) {
    const auto base = FieldPath("stages", i);
    if (!stages[i].IsMap()) {
      issues.Add(base, "stage override must be a mapping");
      continue;
    }

    StageOverride entry;
    entry.id   = ReadRequiredString(stages[i], "id", base, issues).value_or("");
    entry.skip = ReadBool(stages[i], "skip", base, issues);
    if (auto parameters = ReadMapping(stages[i], "parameters", base, issues)) {
      entry.parameters = util::YamlToProtoStruct(*parameters);
    }
    overrides.push_back(std::move(entry));
  }
  return overrides;
}

void Apply(const StageOverride& entry, const std::string& script_name, StageNode& node) {
  for (const auto& [key, value] : entry.parameters.fields()) {
    (*node.parameters.mutable_fields())[key] = value;
  }

  if (!entry.skip) {
    return;
  }
  if (*entry.skip) {
    node.directive = model::SkipMarker{"skipped by script '" + script_name + "'"};
  } else {
    node.directive = model::ExecuteDirective{};
  }
}

} // namespace

GraphDefinition ParseScript(const std::string& yaml_text, const GraphDefinition& manifest) {
  if (manifest.source() != model::DefinitionSource::kManifest) {
    throw util::InvalidState("script overlays must be anchored to a manifest definition");
  }

  const YAML::Node doc = LoadDocument(yaml_text, "script");

  IssueList issues;
  auto      header    = ReadHeader(doc, issues);
  auto      overrides = ReadOverrides(doc, issues);
  if (!issues.empty()) {
    issues.Throw("Invalid script");
  }

  std::vector<std::string> unknown;
  for (const auto& entry : overrides) {
    if (!manifest.Contains(entry.id)) {
      unknown.push_back(entry.id);
    }
  }
  if (!unknown.empty()) {
    std::string names;
    for (const auto& id : unknown) {
      if (!names.empty()) names += ", ";
      names += "'" + id + "'";
    }
    throw util::TopologyError("Script references nonexistent manifest stage(s): " + names, std::move(unknown));
  }

  // Value copy: parameter structs are duplicated, not shared.
  std::vector<StageNode> nodes = manifest.nodes();
  std::unordered_map<std::string, std::size_t> position;
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    position.emplace(nodes[i].id, i);
  }

  const auto script_name = header.name.empty() ? header.manifest : header.name;
  for (const auto& entry : overrides) {
    Apply(entry, script_name, nodes[position.at(entry.id)]);
  }

  STAGEGRAPH_LOG_DEBUG("Applied script", {observability::StringField("script", script_name),
                                          observability::StringField("manifest", manifest.Name()),
                                          observability::IntField("overrides", static_cast<std::int64_t>(overrides.size()))});

  return GraphDefinition(model::DefinitionSource::kScript, std::move(header), std::move(nodes), manifest.edges(), manifest.root_ids(),
                         manifest.terminal_ids());
}

} // namespace stagegraph::parser
