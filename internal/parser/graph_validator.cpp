#include "graph_validator.hpp"

#include <unordered_set>

#include "internal/parser/yaml_schema.hpp"

namespace stagegraph::parser {

std::vector<util::FieldIssue> ValidateGraph(const model::GraphDefinition& definition) {
  IssueList issues;

  const auto& nodes = definition.nodes();
  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    const auto base = FieldPath("stages", i);
    const auto& node = nodes[i];

    if (!seen.insert(node.id).second) {
      issues.Add(FieldPath(base, "id"), "duplicate stage id '" + node.id + "'");
    }

    if (node.previous && node.previous->empty()) {
      issues.Add(FieldPath(base, "previous"), "previous must be null for a root stage, not an empty list");
    }

    for (const auto& parent : node.Parents()) {
      if (!definition.Contains(parent)) {
        issues.Add(FieldPath(base, "previous"), "stage '" + node.id + "' references nonexistent parent '" + parent + "'");
      }
    }
  }

  if (definition.root_ids().empty()) {
    issues.Add("stages", "no root stage (a stage with previous: null)");
  }

  // Compare distinct ids; duplicates are reported above.
  const auto                      order = definition.TopologicalOrder();
  std::unordered_set<std::string> ordered(order.begin(), order.end());
  if (ordered.size() < seen.size()) {
    std::string members;
    for (const auto& node : nodes) {
      if (ordered.count(node.id)) continue;
      if (!members.empty()) members += ", ";
      members += "'" + node.id + "'";
      ordered.insert(node.id);
    }
    issues.Add("stages", "cycle detected through " + members);
  }

  return issues.issues();
}

} // namespace stagegraph::parser
