#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/model/graph_definition.hpp"

namespace stagegraph::session {

struct WorkflowSummary {
  std::string id;
  std::string name;
  std::string persona;
  std::string description;  // first line
  std::size_t stage_count = 0;
};

/*
  Workflow manifests on the host filesystem, one per file:

      <directory>/fedml.manifest.yaml   -> workflow id "fedml"
*/
class ManifestRegistry {
 public:
  explicit ManifestRegistry(std::filesystem::path directory);

  // Sorted. Empty when the directory does not exist.
  std::vector<std::string> List() const;

  // Throws util::NotFound for an unknown id and util::ParseError for an
  // invalid manifest.
  model::GraphDefinition Load(const std::string& workflow_id) const;

  // Manifests that fail to parse are logged and left out.
  std::vector<WorkflowSummary> Summaries() const;

  std::filesystem::path PathOf(const std::string& workflow_id) const;

 private:
  std::filesystem::path directory_;
};

// Reads a whole file; throws std::runtime_error when it cannot be opened.
std::string ReadTextFile(const std::filesystem::path& path);

} // namespace stagegraph::session
