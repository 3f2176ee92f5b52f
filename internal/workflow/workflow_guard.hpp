#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/model/graph_definition.hpp"
#include "internal/readiness/readiness_engine.hpp"

namespace stagegraph::workflow {

struct TransitionResult {
  bool                       allowed    = true;
  bool                       hard_block = false;
  std::string                warning;
  std::optional<std::string> reason;
  std::optional<std::string> suggestion;
  int                        skip_count = 0;
  std::optional<std::string> blocked_by;
};

/*
  Maps user commands to stages and decides whether a command may run
  given the current position.

  Skip counters are per guard instance; one guard per session.
*/
class WorkflowGuard {
 public:
  explicit WorkflowGuard(std::shared_ptr<const model::GraphDefinition> definition);

  /*
    Longest matching phrase first ("show container web" -> "show
    container"), down to the first word. nullptr when no stage claims
    the command.
  */
  const model::StageNode* StageForCommand(const std::string& input) const;

  TransitionResult CheckTransition(const std::string& command, const readiness::WorkflowPosition& position) const;

  // Returns the new count.
  int  RecordSkipAttempt(const std::string& stage_id);
  void ClearSkips(const std::string& stage_id);
  int  SkipCount(const std::string& stage_id) const;

  const model::GraphDefinition& definition() const { return *definition_; }

 private:
  std::shared_ptr<const model::GraphDefinition>  definition_;
  std::unordered_map<std::string, std::size_t>   command_index_;  // command -> node position
  std::unordered_map<std::string, int>           skip_counts_;
};

/*
      Workflow: Federated Training
      Progress: 2/5 stages

        ● Search
        * Gather [STALE]
        ○ Harmonize ← NEXT
*/
std::string RenderProgress(const model::GraphDefinition& definition, const readiness::WorkflowPosition& position);

} // namespace stagegraph::workflow
