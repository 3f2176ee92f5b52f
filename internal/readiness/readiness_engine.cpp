#include "readiness_engine.hpp"

#include <unordered_map>

#include "internal/fingerprint/chain.hpp"
#include "internal/observability/logging.hpp"
#include "internal/provenance/envelope_codec.hpp"

namespace stagegraph::readiness {

namespace {

struct Snapshot {
  std::optional<fingerprint::FingerprintRecord> record;
  bool                                          sentinel = false;
};

} // namespace

std::vector<NodeReadiness> ResolveReadiness(const model::GraphDefinition& definition, const storage::ArtifactStore& store,
                                            const std::string& session_root, std::vector<IntegrityWarning>* warnings) {
  std::unordered_map<std::string, Snapshot> snapshots;

  const bool session_exists = session_root.empty() || store.Exists(session_root);
  if (session_exists) {
    provenance::EnvelopeLocator locator(definition, store, session_root);
    for (const auto& node : definition.nodes()) {
      auto lookup = locator.Latest(node.id);
      if (warnings) {
        warnings->insert(warnings->end(), lookup.warnings.begin(), lookup.warnings.end());
      }

      Snapshot snapshot;
      if (lookup.latest) {
        const auto& envelope = lookup.latest->envelope;
        snapshot.record      = fingerprint::FingerprintRecord{envelope.fingerprint(), fingerprint::ParentsOf(envelope)};
        snapshot.sentinel    = provenance::IsSentinel(envelope);
      }
      snapshots.emplace(node.id, std::move(snapshot));
    }
  } else {
    STAGEGRAPH_LOG_DEBUG("Session root not present", {observability::StringField("root", session_root)});
  }

  auto complete = [&](const std::string& id) {
    auto it = snapshots.find(id);
    return it != snapshots.end() && it->second.record.has_value();
  };

  std::vector<NodeReadiness> result;
  result.reserve(definition.size());

  for (const auto& node : definition.nodes()) {
    NodeReadiness r;
    r.id       = node.id;
    r.complete = complete(node.id);

    for (const auto& parent_id : node.Parents()) {
      if (!complete(parent_id)) r.pending_parents.push_back(parent_id);
    }
    r.ready = r.pending_parents.empty();

    if (r.complete) {
      const auto& snapshot = snapshots.at(node.id);
      r.skipped            = snapshot.sentinel;
      r.fingerprint        = snapshot.record->fingerprint;

      fingerprint::ParentFingerprints current;
      for (const auto& parent_id : node.Parents()) {
        if (complete(parent_id)) current[parent_id] = snapshots.at(parent_id).record->fingerprint;
      }

      auto staleness  = fingerprint::CheckStaleness(node.id, *snapshot.record, current);
      r.stale         = staleness.stale;
      r.stale_parents = std::move(staleness.stale_parents);
    }

    result.push_back(std::move(r));
  }

  return result;
}

WorkflowPosition ResolvePosition(const model::GraphDefinition& definition, const storage::ArtifactStore& store,
                                 const std::string& session_root) {
  WorkflowPosition position;
  position.readiness = ResolveReadiness(definition, store, session_root, &position.warnings);

  std::unordered_map<std::string, bool> complete;
  for (const auto& r : position.readiness) {
    complete[r.id] = r.complete;
    if (r.complete) position.completed_stages.push_back(r.id);
    if (r.stale) position.stale_stages.push_back(r.id);
    if (!position.current_stage && r.ready && !r.complete) position.current_stage = r.id;
  }

  position.is_complete = !definition.terminal_ids().empty();
  for (const auto& id : definition.terminal_ids()) {
    position.is_complete = position.is_complete && complete[id];
  }

  position.progress.completed = position.completed_stages.size();
  position.progress.total     = definition.size();

  if (position.current_stage) {
    const auto* node            = definition.Find(*position.current_stage);
    position.next_instruction   = node->instruction;
    position.available_commands = node->commands;
    position.progress.phase     = node->phase;
  }

  return position;
}

} // namespace stagegraph::readiness
