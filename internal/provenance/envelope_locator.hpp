#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/graph_definition.hpp"
#include "internal/paths/session_paths.hpp"
#include "internal/provenance/envelope_codec.hpp"
#include "internal/storage/artifact_store.hpp"

namespace stagegraph::provenance {

enum class IntegrityKind {
  kCorrupt,
  kFingerprintMismatch,
  kStoreError,
};

// "corrupt", "fingerprint_mismatch", "store_error"
const char* ToString(IntegrityKind kind);

/*
  An envelope that exists but cannot be trusted. Reported separately from
  "not produced yet": the remedy is investigation, not a re-run.
*/
struct IntegrityWarning {
  std::string   stage;
  std::string   path;
  IntegrityKind kind = IntegrityKind::kCorrupt;
  std::string   detail;
};

struct LocatedEnvelope {
  ArtifactEnvelope envelope;
  std::string      path;
};

struct EnvelopeLookup {
  std::optional<LocatedEnvelope> latest;
  std::vector<IntegrityWarning>  warnings;
};

/*
  Finds the envelopes of a stage inside one session tree.

  A stage directory has the canonical name (its id) or a branch name
  `<id>_BRANCH_<suffix>` next to it:

      search/gather/meta/gather.json
      search/gather_BRANCH_20261019T081502041337Z/meta/gather.json

  The latest envelope lives in the most recent directory: the canonical
  one is the oldest, branches follow in suffix order and then by their
  -N counter. Timestamps inside the envelopes are not consulted. When
  the most recent envelope is unreadable or fails verification the
  stage has no latest envelope; an older one never stands in for it.

  Holds references: the definition and store must outlive the locator.
*/
class EnvelopeLocator {
 public:
  EnvelopeLocator(const model::GraphDefinition& definition, const storage::ArtifactStore& store, std::string session_root);

  // Throws util::NotFound for an unknown stage.
  EnvelopeLookup Latest(const std::string& stage_id) const;

  // <root>/<nesting>/meta/<artifact>
  std::string CanonicalArtifactPath(const std::string& stage_id) const;

  // <root>/<parent nesting>/<branch_segment>/meta/<artifact>
  std::string BranchArtifactPath(const std::string& stage_id, const std::string& branch_segment) const;

  const paths::StagePath& PathOf(const std::string& stage_id) const;

  const paths::PathMap& paths() const { return paths_; }
  const std::string&    session_root() const { return session_root_; }

 private:
  std::string ContainerOf(const paths::StagePath& path) const;

  const model::GraphDefinition& definition_;
  const storage::ArtifactStore& store_;
  std::string                   session_root_;
  paths::PathMap                paths_;
};

// "<segment>_BRANCH_"
std::string BranchPrefix(const std::string& segment);

// Recency of one stage directory among its siblings.
struct BranchRank {
  std::string   name;
  bool          branch = false;
  std::string   stamp;
  unsigned long counter = 0;

  bool operator<(const BranchRank& other) const;
};

// nullopt when `directory` is neither `segment` nor one of its branches.
std::optional<BranchRank> RankOf(const std::string& segment, const std::string& directory);

} // namespace stagegraph::provenance
