#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <optional>
#include <string>

#include "internal/fingerprint/hasher.hpp"
#include "internal/model/graph_definition.hpp"
#include "internal/provenance/envelope_locator.hpp"
#include "internal/storage/artifact_store.hpp"

namespace stagegraph::provenance {

struct MaterializeResult {
  ArtifactEnvelope envelope;
  std::string      path;
  bool             branched = false;
};

/*
  Writes fingerprinted envelopes into one session tree.

  Parent fingerprints come from the latest envelope of every parent in
  `previous`; parents with no envelope are left out. An existing envelope
  is never overwritten: a re-run goes to a branch directory beside the
  canonical one.

  No locking. Callers keep at most one writer per (session, stage).
*/
class MerkleEngine {
 public:
  MerkleEngine(std::shared_ptr<const model::GraphDefinition> definition, storage::ArtifactStorePtr store, std::string session_root);

  /*
    Throws:
      util::NotFound    unknown stage
      util::StoreError  the envelope could not be written
  */
  MaterializeResult Materialize(const std::string& stage_id, const google::protobuf::Struct& content);

  // Same, recording `parameters_used` instead of the stage parameters.
  MaterializeResult Materialize(const std::string& stage_id, const google::protobuf::Struct& content,
                                const google::protobuf::Struct& parameters_used);

  /*
    Writes a skip sentinel. Only optional stages and stages a script
    marked as skipped may be skipped; anything else is util::InvalidState.
    An empty reason falls back to the script's reason.
  */
  MaterializeResult MaterializeSkip(const std::string& stage_id, const std::string& reason = {});

  // Fingerprint of the latest valid envelope, nullopt if none.
  std::optional<std::string> FingerprintOf(const std::string& stage_id) const;

  fingerprint::ParentFingerprints ResolveParentFingerprints(const model::StageNode& node) const;

  const EnvelopeLocator& locator() const { return locator_; }

 private:
  const model::StageNode& NodeOf(const std::string& stage_id) const;

  std::string Write(const model::StageNode& node, const std::string& bytes, const std::string& suffix, bool* branched);

  std::shared_ptr<const model::GraphDefinition> definition_;
  storage::ArtifactStorePtr                     store_;
  EnvelopeLocator                               locator_;
};

} // namespace stagegraph::provenance
