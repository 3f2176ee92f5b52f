#include "session_paths.hpp"

#include <algorithm>
#include <unordered_set>

namespace stagegraph::paths {

std::string StagePath::Nesting() const {
  const auto slash = data_dir.rfind('/');
  return slash == std::string::npos ? std::string{} : data_dir.substr(0, slash);
}

std::string StagePath::ArtifactName() const {
  const auto slash = artifact_file.rfind('/');
  return slash == std::string::npos ? artifact_file : artifact_file.substr(slash + 1);
}

std::vector<std::string> NestingSegments(const model::GraphDefinition& definition, const model::StageNode& node) {
  std::vector<std::string> segments{node.id};

  std::unordered_set<std::string> visited{node.id};
  const model::StageNode*         current = &node;
  while (!current->Parents().empty()) {
    const auto* parent = definition.Find(current->Parents().front());
    if (parent == nullptr || !visited.insert(parent->id).second) {
      break;
    }
    if (!parent->IsPathTransparent()) {
      segments.push_back(parent->id);
    }
    current = parent;
  }

  std::reverse(segments.begin(), segments.end());
  return segments;
}

PathMap ResolvePaths(const model::GraphDefinition& definition) {
  PathMap paths;
  paths.reserve(definition.size());

  for (const auto& node : definition.nodes()) {
    std::string nesting;
    for (const auto& segment : NestingSegments(definition, node)) {
      nesting = JoinPath(nesting, segment);
    }

    const std::string artifact = node.produces.empty() ? node.id + ".json" : node.produces.front();

    StagePath path;
    path.data_dir      = nesting + "/data";
    path.artifact_file = nesting + "/meta/" + artifact;
    paths.emplace(node.id, std::move(path));
  }

  return paths;
}

std::string JoinPath(const std::string& base, const std::string& relative) {
  if (base.empty()) return relative;
  if (relative.empty()) return base;
  if (base.back() == '/') return base + relative;
  return base + "/" + relative;
}

} // namespace stagegraph::paths
