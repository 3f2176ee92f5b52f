#include "merkle_engine.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stagegraph::provenance {

namespace {

// Upper bound on -N suffixes tried for one branch name.
constexpr int kMaxBranchAttempts = 1000;

} // namespace

MerkleEngine::MerkleEngine(std::shared_ptr<const model::GraphDefinition> definition, storage::ArtifactStorePtr store, std::string session_root)
    : definition_(std::move(definition)), store_(std::move(store)), locator_(*definition_, *store_, std::move(session_root)) {
}

const model::StageNode& MerkleEngine::NodeOf(const std::string& stage_id) const {
  const auto* node = definition_->Find(stage_id);
  if (node == nullptr) {
    throw util::NotFound("unknown stage '" + stage_id + "' in workflow '" + definition_->Name() + "'");
  }
  return *node;
}

fingerprint::ParentFingerprints MerkleEngine::ResolveParentFingerprints(const model::StageNode& node) const {
  fingerprint::ParentFingerprints parents;
  for (const auto& parent_id : node.Parents()) {
    if (!definition_->Contains(parent_id)) continue;
    auto lookup = locator_.Latest(parent_id);
    if (lookup.latest) {
      parents[parent_id] = lookup.latest->envelope.fingerprint();
    }
  }
  return parents;
}

std::optional<std::string> MerkleEngine::FingerprintOf(const std::string& stage_id) const {
  NodeOf(stage_id);
  auto lookup = locator_.Latest(stage_id);
  if (!lookup.latest) return std::nullopt;
  return lookup.latest->envelope.fingerprint();
}

MaterializeResult MerkleEngine::Materialize(const std::string& stage_id, const google::protobuf::Struct& content) {
  return Materialize(stage_id, content, NodeOf(stage_id).parameters);
}

MaterializeResult MerkleEngine::Materialize(const std::string& stage_id, const google::protobuf::Struct& content,
                                            const google::protobuf::Struct& parameters_used) {
  const auto& node    = NodeOf(stage_id);
  const auto  parents = ResolveParentFingerprints(node);
  const auto  now     = util::Now();

  MaterializeResult result;
  auto& envelope = result.envelope;
  envelope.set_stage(node.id);
  envelope.set_timestamp(util::ToIso8601(now));
  *envelope.mutable_parameters_used() = parameters_used;
  *envelope.mutable_content()         = content;
  envelope.set_fingerprint(fingerprint::Compute(content, parents));
  envelope.mutable_parent_fingerprints()->insert(parents.begin(), parents.end());

  result.path = Write(node, EncodeEnvelope(envelope), util::ToPathSuffix(now), &result.branched);

  STAGEGRAPH_LOG_INFO("Materialized stage", {observability::StringField("stage", node.id), observability::StringField("path", result.path),
                                             observability::StringField("fingerprint", envelope.fingerprint()),
                                             observability::IntField("parents", static_cast<std::int64_t>(parents.size())),
                                             observability::BoolField("branched", result.branched)});
  return result;
}

MaterializeResult MerkleEngine::MaterializeSkip(const std::string& stage_id, const std::string& reason) {
  const auto& node = NodeOf(stage_id);
  if (!node.optional && !node.IsSkipped()) {
    throw util::InvalidState("stage '" + stage_id + "' is required and cannot be skipped");
  }

  std::string effective = reason;
  if (effective.empty() && node.IsSkipped()) {
    effective = std::get<model::SkipMarker>(node.directive).reason;
  }
  if (effective.empty()) {
    effective = "skipped";
  }

  return Materialize(stage_id, SentinelContent(effective));
}

/*
  Canonical path first; on collision a branch named after the write time,
  then the same name with -2, -3, ... until the store accepts one.
*/
std::string MerkleEngine::Write(const model::StageNode& node, const std::string& bytes, const std::string& suffix, bool* branched) {
  auto path = locator_.CanonicalArtifactPath(node.id);
  if (store_->CreateAtomically(path, bytes) == storage::CreateResult::kCreated) {
    *branched = false;
    return path;
  }

  const auto branch = BranchPrefix(node.id) + suffix;
  for (int attempt = 1; attempt <= kMaxBranchAttempts; ++attempt) {
    const auto segment = attempt == 1 ? branch : branch + "-" + std::to_string(attempt);
    path               = locator_.BranchArtifactPath(node.id, segment);
    if (store_->CreateAtomically(path, bytes) == storage::CreateResult::kCreated) {
      *branched = true;
      return path;
    }
  }

  throw util::StoreError("no free branch for stage '" + node.id + "' under " + branch);
}

} // namespace stagegraph::provenance
