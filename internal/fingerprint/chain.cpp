#include "chain.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace stagegraph::fingerprint {

StalenessResult CheckStaleness(const std::string& stage_id, const FingerprintRecord& recorded,
                               const ParentFingerprints& current_parents) {
  StalenessResult result;
  result.stage_id            = stage_id;
  result.current_fingerprint = recorded.fingerprint;

  for (const auto& [parent_id, recorded_fp] : recorded.parent_fingerprints) {
    auto it = current_parents.find(parent_id);
    if (it != current_parents.end() && it->second != recorded_fp) {
      result.stale_parents.push_back(parent_id);
    }
  }

  result.stale = !result.stale_parents.empty();
  return result;
}

ChainValidationResult ValidateChain(const model::GraphDefinition& definition, const FingerprintReader& reader) {
  ChainValidationResult result;

  std::unordered_map<std::string, std::string> current;
  std::unordered_set<std::string>              stale_ids;

  for (const auto& stage_id : definition.TopologicalOrder()) {
    auto record = reader(stage_id);
    if (!record) {
      result.missing_stages.push_back(stage_id);
      continue;
    }

    current[stage_id] = record->fingerprint;

    const auto& parents = definition.Find(stage_id)->Parents();

    ParentFingerprints current_parents;
    for (const auto& parent_id : parents) {
      auto it = current.find(parent_id);
      if (it != current.end()) current_parents[parent_id] = it->second;
    }

    auto staleness = CheckStaleness(stage_id, *record, current_parents);

    for (const auto& parent_id : parents) {
      if (stale_ids.count(parent_id) &&
          std::find(staleness.stale_parents.begin(), staleness.stale_parents.end(), parent_id) == staleness.stale_parents.end()) {
        staleness.stale_parents.push_back(parent_id);
        staleness.stale = true;
      }
    }

    if (staleness.stale) {
      stale_ids.insert(stage_id);
      result.stale_stages.push_back(std::move(staleness));
    }
  }

  result.valid = result.stale_stages.empty() && result.missing_stages.empty();
  return result;
}

} // namespace stagegraph::fingerprint
