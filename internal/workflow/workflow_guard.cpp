#include "workflow_guard.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace stagegraph::workflow {

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::vector<std::string> Words(const std::string& text) {
  std::istringstream       in(text);
  std::vector<std::string> words;
  for (std::string word; in >> word;) words.push_back(word);
  return words;
}

std::string Join(const std::vector<std::string>& words) {
  std::string out;
  for (const auto& word : words) {
    if (!out.empty()) out.push_back(' ');
    out += word;
  }
  return out;
}

// "show container <name>" -> "show container"
std::string CanonicalCommand(const std::string& command) {
  const auto cut = command.find_first_of("<[");
  return Join(Words(Lower(command.substr(0, cut))));
}

std::string BaseVerb(const std::string& command) {
  const auto words = Words(Lower(command));
  return words.empty() ? std::string{} : words.front();
}

TransitionResult Allowed() {
  return TransitionResult{};
}

} // namespace

WorkflowGuard::WorkflowGuard(std::shared_ptr<const model::GraphDefinition> definition) : definition_(std::move(definition)) {
  const auto& nodes = definition_->nodes();

  // Multi-word commands are the most specific.
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    for (const auto& command : nodes[i].commands) {
      const auto canonical = CanonicalCommand(command);
      if (Words(canonical).size() > 1) {
        command_index_.emplace(canonical, i);
      }
    }
  }

  // Single-word commands named after their own stage.
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    for (const auto& command : nodes[i].commands) {
      const auto canonical = CanonicalCommand(command);
      if (Words(canonical).size() == 1 && canonical == nodes[i].id) {
        command_index_[canonical] = i;
      }
    }
  }

  // Base verbs, unless another stage owns a multi-word command starting with it.
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    for (const auto& command : nodes[i].commands) {
      const auto verb = BaseVerb(command);
      if (verb.empty() || command_index_.count(verb)) continue;

      const bool shadowed = std::any_of(command_index_.begin(), command_index_.end(), [&](const auto& entry) {
        const auto words = Words(entry.first);
        return words.size() > 1 && words.front() == verb && entry.second != i;
      });
      if (!shadowed) {
        command_index_.emplace(verb, i);
      }
    }
  }
}

const model::StageNode* WorkflowGuard::StageForCommand(const std::string& input) const {
  auto words = Words(Lower(input));

  // Longest indexed prefix: "show container web" matches "show container".
  for (; !words.empty(); words.pop_back()) {
    auto it = command_index_.find(Join(words));
    if (it != command_index_.end()) {
      return &definition_->nodes()[it->second];
    }
  }
  return nullptr;
}

TransitionResult WorkflowGuard::CheckTransition(const std::string& command, const readiness::WorkflowPosition& position) const {
  const auto* target = StageForCommand(command);
  if (target == nullptr) {
    return Allowed();
  }

  auto it = std::find_if(position.readiness.begin(), position.readiness.end(),
                         [&](const readiness::NodeReadiness& r) { return r.id == target->id; });
  if (it == position.readiness.end() || it->complete || it->pending_parents.empty()) {
    return Allowed();
  }

  for (const auto& parent_id : it->pending_parents) {
    const auto* parent = definition_->Find(parent_id);
    if (parent == nullptr) continue;

    if (!parent->optional && !parent->skip_warning) {
      TransitionResult blocked;
      blocked.allowed    = false;
      blocked.hard_block = true;
      blocked.warning    = "PREREQUISITE NOT MET: " + parent->name;
      blocked.reason     = "This action requires completion of the '" + parent->name + "' stage.";
      blocked.suggestion = parent->commands.empty() ? "Complete the previous stage first."
                                                    : "Run '" + parent->commands.front() + "' to proceed.";
      blocked.blocked_by = parent->id;
      std::transform(blocked.warning.begin(), blocked.warning.end(), blocked.warning.begin(),
                     [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
      return blocked;
    }

    if (parent->skip_warning) {
      const int count = SkipCount(parent->id);
      if (count >= parent->skip_warning->max_warnings) continue;

      TransitionResult warned;
      warned.allowed    = false;
      warned.warning    = parent->skip_warning->short_text;
      warned.skip_count = count;
      warned.blocked_by = parent->id;
      if (count >= 1) warned.reason = parent->skip_warning->reason;
      if (!parent->commands.empty()) warned.suggestion = "Run '" + parent->commands.front() + "' to complete this step.";
      return warned;
    }
  }

  return Allowed();
}

int WorkflowGuard::RecordSkipAttempt(const std::string& stage_id) {
  return ++skip_counts_[stage_id];
}

void WorkflowGuard::ClearSkips(const std::string& stage_id) {
  skip_counts_.erase(stage_id);
}

int WorkflowGuard::SkipCount(const std::string& stage_id) const {
  auto it = skip_counts_.find(stage_id);
  return it == skip_counts_.end() ? 0 : it->second;
}

std::string RenderProgress(const model::GraphDefinition& definition, const readiness::WorkflowPosition& position) {
  auto contains = [](const std::vector<std::string>& ids, const std::string& id) { return std::find(ids.begin(), ids.end(), id) != ids.end(); };

  std::ostringstream out;
  out << "Workflow: " << definition.Name() << "\n";
  out << "Progress: " << position.progress.completed << "/" << position.progress.total << " stages\n\n";

  for (const auto& node : definition.nodes()) {
    const bool stale    = contains(position.stale_stages, node.id);
    const bool complete = contains(position.completed_stages, node.id);

    out << "  " << (stale ? "*" : complete ? "●" : "○") << " " << node.name;
    if (stale) out << " [STALE]";
    if (position.current_stage && *position.current_stage == node.id) out << " ← NEXT";
    out << "\n";
  }

  return out.str();
}

} // namespace stagegraph::workflow
