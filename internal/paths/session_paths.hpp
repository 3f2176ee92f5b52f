#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/graph_definition.hpp"

namespace stagegraph::paths {

/*
  Where a stage lives in a session tree, relative to the session root.

      search/gather/harmonize/data                  dataDir
      search/gather/harmonize/meta/harmonize.json   artifactFile
*/
struct StagePath {
  std::string data_dir;
  std::string artifact_file;

  // "search/gather/harmonize"
  std::string Nesting() const;

  // "harmonize.json"
  std::string ArtifactName() const;
};

using PathMap = std::unordered_map<std::string, StagePath>;

/*
  Computes the nesting path of every stage.

  A stage nests under its primary parent (previous[0]) recursively up to
  a root. Structural stages and non-root optional stages are skipped as
  ancestors so gates, joins and bypass branches never show up as
  directories. A root-level optional stage is kept: it is the only
  anchor its subtree has.

  Never throws: an unknown parent or a revisited stage ends the walk as
  if a root had been reached.
*/
PathMap ResolvePaths(const model::GraphDefinition& definition);

// Nesting segments of one stage, root first, ending with the stage id.
std::vector<std::string> NestingSegments(const model::GraphDefinition& definition, const model::StageNode& node);

std::string JoinPath(const std::string& base, const std::string& relative);

} // namespace stagegraph::paths
