#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/graph_definition.hpp"
#include "internal/provenance/envelope_locator.hpp"
#include "internal/storage/artifact_store.hpp"

namespace stagegraph::readiness {

using provenance::IntegrityKind;
using provenance::IntegrityWarning;

struct NodeReadiness {
  std::string id;
  bool        ready    = false;  // every parent complete
  bool        complete = false;  // a valid envelope or sentinel exists
  bool        skipped  = false;  // latest envelope is a sentinel
  bool        stale    = false;  // a recorded parent fingerprint changed

  std::vector<std::string>   pending_parents;
  std::vector<std::string>   stale_parents;
  std::optional<std::string> fingerprint;
};

struct Progress {
  std::size_t                completed = 0;
  std::size_t                total     = 0;
  std::optional<std::string> phase;
};

/*
  What is done, what is next and what is blocked.

  Collaborators answer status questions from this alone; nothing else
  should derive readiness from raw store listings.
*/
struct WorkflowPosition {
  std::vector<std::string>   completed_stages;   // declaration order
  std::optional<std::string> current_stage;      // first ready, incomplete stage
  std::string                next_instruction;
  std::vector<std::string>   available_commands;
  std::vector<std::string>   stale_stages;

  std::vector<NodeReadiness> readiness;
  Progress                   progress;
  bool                       is_complete = false;

  std::vector<IntegrityWarning> warnings;
};

/*
  Readiness of every stage, in declaration order.

  Evaluated against the store on every call. A missing session root
  means nothing has run. Unreadable or tampered envelopes count as not
  complete and are reported through `warnings` when given. Only a failure
  to check the session root itself throws (util::StoreError).
*/
std::vector<NodeReadiness> ResolveReadiness(const model::GraphDefinition& definition, const storage::ArtifactStore& store,
                                            const std::string& session_root, std::vector<IntegrityWarning>* warnings = nullptr);

WorkflowPosition ResolvePosition(const model::GraphDefinition& definition, const storage::ArtifactStore& store,
                                 const std::string& session_root);

} // namespace stagegraph::readiness
