#include "manifest_registry.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/parser/manifest_parser.hpp"
#include "internal/util/errors.hpp"

namespace stagegraph::session {

namespace {

constexpr char kManifestSuffix[] = ".manifest.yaml";

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() > suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string ReadTextFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

ManifestRegistry::ManifestRegistry(std::filesystem::path directory) : directory_(std::move(directory)) {
}

std::vector<std::string> ManifestRegistry::List() const {
  std::vector<std::string> ids;

  std::error_code ec;
  if (!std::filesystem::is_directory(directory_, ec)) {
    return ids;
  }

  for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
    if (!entry.is_regular_file()) continue;
    const auto name = entry.path().filename().string();
    if (EndsWith(name, kManifestSuffix)) {
      ids.push_back(name.substr(0, name.size() - std::char_traits<char>::length(kManifestSuffix)));
    }
  }

  std::sort(ids.begin(), ids.end());
  return ids;
}

std::filesystem::path ManifestRegistry::PathOf(const std::string& workflow_id) const {
  return directory_ / (workflow_id + kManifestSuffix);
}

model::GraphDefinition ManifestRegistry::Load(const std::string& workflow_id) const {
  const auto ids = List();
  if (std::find(ids.begin(), ids.end(), workflow_id) == ids.end()) {
    std::string available;
    for (const auto& id : ids) available += (available.empty() ? "" : ", ") + id;
    throw util::NotFound("workflow '" + workflow_id + "' not found. Available: " + available);
  }
  return parser::ParseManifest(ReadTextFile(PathOf(workflow_id)));
}

std::vector<WorkflowSummary> ManifestRegistry::Summaries() const {
  std::vector<WorkflowSummary> summaries;

  for (const auto& id : List()) {
    try {
      const auto  definition = Load(id);
      const auto& header     = std::get<model::ManifestHeader>(definition.header());

      WorkflowSummary summary;
      summary.id          = id;
      summary.name        = header.name;
      summary.persona     = header.persona;
      summary.description = header.description.substr(0, header.description.find('\n'));
      summary.stage_count = definition.size();
      summaries.push_back(std::move(summary));
    } catch (const std::runtime_error& e) {
      STAGEGRAPH_LOG_WARN("Skipping invalid manifest", {observability::StringField("workflow", id), observability::StringField("error", e.what())});
    }
  }

  return summaries;
}

} // namespace stagegraph::session
