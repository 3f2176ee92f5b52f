#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/fingerprint/hasher.hpp"
#include "internal/model/graph_definition.hpp"

namespace stagegraph::fingerprint {

struct FingerprintRecord {
  std::string        fingerprint;
  ParentFingerprints parent_fingerprints;
};

struct StalenessResult {
  std::string              stage_id;
  bool                     stale = false;
  std::vector<std::string> stale_parents;
  std::string              current_fingerprint;
};

/*
  A stage is stale when a parent it recorded now has a different
  fingerprint. Parents with no current fingerprint are ignored.
*/
StalenessResult CheckStaleness(const std::string& stage_id, const FingerprintRecord& recorded,
                               const ParentFingerprints& current_parents);

// nullopt when the stage has no artifact.
using FingerprintReader = std::function<std::optional<FingerprintRecord>(const std::string& stage_id)>;

struct ChainValidationResult {
  bool                         valid = true;
  std::vector<StalenessResult> stale_stages;
  std::vector<std::string>     missing_stages;
};

/*
  Walks the graph in topological order. Staleness cascades: a stage below
  a stale stage is stale even if its own recorded parents still match.
*/
ChainValidationResult ValidateChain(const model::GraphDefinition& definition, const FingerprintReader& reader);

} // namespace stagegraph::fingerprint
