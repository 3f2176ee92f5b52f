#include "manifest_parser.hpp"

#include <unordered_set>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/parser/graph_validator.hpp"
#include "internal/parser/yaml_schema.hpp"
#include "internal/util/yaml_proto.hpp"

namespace stagegraph::parser {

using model::Edge;
using model::GraphDefinition;
using model::ManifestHeader;
using model::SkipWarning;
using model::StageNode;

namespace {

bool IsLowercaseIdentifier(const std::string& value) {
  if (value.empty() || value[0] < 'a' || value[0] > 'z') {
    return false;
  }
  for (char c : value) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

/*
  previous: absent/null -> root, "a" -> {a}, [a, b] -> {a, b}.
  The empty list is kept so the graph validator can reject it.
*/
std::optional<std::vector<std::string>> ReadPrevious(const YAML::Node& stage, const std::string& base, IssueList& issues) {
  const YAML::Node node = stage["previous"];
  if (!node.IsDefined() || node.IsNull()) {
    return std::nullopt;
  }
  if (node.IsScalar()) {
    return std::vector<std::string>{node.Scalar()};
  }

  auto list = ReadStringList(stage, "previous", base, issues);
  if (!list) {
    return std::vector<std::string>{};
  }
  return list;
}

std::optional<SkipWarning> ReadSkipWarning(const YAML::Node& stage, const std::string& base, IssueList& issues) {
  auto node = ReadMapping(stage, "skip_warning", base, issues);
  if (!node) {
    return std::nullopt;
  }

  const auto  path = FieldPath(base, "skip_warning");
  SkipWarning warning;
  warning.short_text   = ReadString(*node, "short", path, issues).value_or("");
  warning.reason       = ReadString(*node, "reason", path, issues).value_or("");
  warning.max_warnings = ReadNonNegativeInt(*node, "max_warnings", path, issues).value_or(2);
  return warning;
}

StageNode ReadStage(const YAML::Node& stage, const std::string& base, IssueList& issues) {
  StageNode node;
  if (!stage.IsMap()) {
    issues.Add(base, "stage must be a mapping");
    return node;
  }

  node.id = ReadRequiredString(stage, "id", base, issues).value_or("");
  if (!node.id.empty()) {
    CheckPathSegment(node.id, FieldPath(base, "id"), issues);
  }
  node.name = ReadString(stage, "name", base, issues).value_or(node.id);

  node.produces = ReadStringList(stage, "produces", base, issues).value_or(std::vector<std::string>{});
  if (node.produces.empty()) {
    issues.Add(FieldPath(base, "produces"), "produces must be a non-empty list");
  }
  for (std::size_t i = 0; i < node.produces.size(); ++i) {
    CheckPathSegment(node.produces[i], FieldPath(FieldPath(base, "produces"), i), issues);
  }

  node.phase      = ReadString(stage, "phase", base, issues);
  node.previous   = ReadPrevious(stage, base, issues);
  node.optional   = ReadBool(stage, "optional", base, issues).value_or(false);
  node.structural = ReadBool(stage, "structural", base, issues).value_or(false);

  if (auto parameters = ReadMapping(stage, "parameters", base, issues)) {
    node.parameters = util::YamlToProtoStruct(*parameters);
  }

  node.instruction = ReadString(stage, "instruction", base, issues).value_or("");
  node.commands    = ReadStringList(stage, "commands", base, issues).value_or(std::vector<std::string>{});

  node.handler = ReadString(stage, "handler", base, issues);
  if (node.handler && !IsLowercaseIdentifier(*node.handler)) {
    issues.Add(FieldPath(base, "handler"), "handler must be a lowercase identifier");
  }

  node.skip_warning = ReadSkipWarning(stage, base, issues);
  node.narrative    = ReadString(stage, "narrative", base, issues);
  node.blueprint    = ReadStringList(stage, "blueprint", base, issues).value_or(std::vector<std::string>{});
  return node;
}

ManifestHeader ReadHeader(const YAML::Node& doc, IssueList& issues) {
  ManifestHeader header;
  header.name        = ReadRequiredString(doc, "name", "", issues).value_or("");
  header.persona     = ReadRequiredString(doc, "persona", "", issues).value_or("");
  header.description = ReadString(doc, "description", "", issues).value_or("");
  header.category    = ReadString(doc, "category", "", issues).value_or("");
  header.version     = ReadString(doc, "version", "", issues).value_or("1.0.0");
  header.locked      = ReadBool(doc, "locked", "", issues).value_or(false);
  header.authors     = ReadString(doc, "authors", "", issues).value_or("");
  return header;
}

} // namespace

GraphDefinition ParseManifest(const std::string& yaml_text) {
  const YAML::Node doc = LoadDocument(yaml_text, "manifest");

  IssueList issues;
  auto      header = ReadHeader(doc, issues);

  std::vector<StageNode> nodes;
  const YAML::Node       stages = doc["stages"];
  if (!stages.IsDefined() || stages.IsNull()) {
    issues.Add("stages", "stages is required");
  } else if (!stages.IsSequence() || stages.size() == 0) {
    issues.Add("stages", "manifest must have at least one stage");
  } else {
    nodes.reserve(stages.size());
    for (std::size_t i = 0; i < stages.size(); ++i) {
      nodes.push_back(ReadStage(stages[i], FieldPath("stages", i), issues));
    }
  }

  if (!issues.empty()) {
    issues.Throw("Invalid manifest");
  }

  // Edges invert the backward `previous` pointers.
  std::vector<Edge> edges;
  for (const auto& node : nodes) {
    for (const auto& parent : node.Parents()) {
      edges.push_back({parent, node.id});
    }
  }

  std::vector<std::string> root_ids;
  for (const auto& node : nodes) {
    if (node.IsRoot()) root_ids.push_back(node.id);
  }

  std::unordered_set<std::string> parent_ids;
  for (const auto& edge : edges) {
    parent_ids.insert(edge.from);
  }
  std::vector<std::string> terminal_ids;
  for (const auto& node : nodes) {
    if (!parent_ids.count(node.id)) terminal_ids.push_back(node.id);
  }

  GraphDefinition definition(model::DefinitionSource::kManifest, std::move(header), std::move(nodes), std::move(edges), std::move(root_ids),
                             std::move(terminal_ids));

  auto structural_issues = ValidateGraph(definition);
  if (!structural_issues.empty()) {
    throw util::ParseError("Invalid manifest", std::move(structural_issues));
  }

  STAGEGRAPH_LOG_DEBUG("Parsed manifest", {observability::StringField("name", definition.Name()),
                                           observability::IntField("stages", static_cast<std::int64_t>(definition.size())),
                                           observability::IntField("edges", static_cast<std::int64_t>(definition.edges().size()))});
  return definition;
}

} // namespace stagegraph::parser
