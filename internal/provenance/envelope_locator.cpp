#include "envelope_locator.hpp"

#include <algorithm>
#include <tuple>

#include "internal/fingerprint/hasher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace stagegraph::provenance {

using stagegraph::paths::JoinPath;
using stagegraph::storage::common::ParentOf;

const char* ToString(IntegrityKind kind) {
  switch (kind) {
    case IntegrityKind::kCorrupt:
      return "corrupt";
    case IntegrityKind::kFingerprintMismatch:
      return "fingerprint_mismatch";
    case IntegrityKind::kStoreError:
      return "store_error";
  }
  return "unknown";
}

std::string BranchPrefix(const std::string& segment) {
  return segment + "_BRANCH_";
}

bool BranchRank::operator<(const BranchRank& other) const {
  return std::tie(branch, stamp, counter, name) < std::tie(other.branch, other.stamp, other.counter, other.name);
}

std::optional<BranchRank> RankOf(const std::string& segment, const std::string& directory) {
  if (directory == segment) {
    return BranchRank{directory, false, {}, 0};
  }

  const auto prefix = BranchPrefix(segment);
  if (directory.size() <= prefix.size() || directory.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }

  BranchRank rank{directory, true, directory.substr(prefix.size()), 1};
  const auto dash = rank.stamp.rfind('-');
  if (dash != std::string::npos) {
    const auto digits = rank.stamp.substr(dash + 1);
    const bool numeric = !digits.empty() && digits.size() <= 9 &&
                         std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; });
    if (numeric) {
      rank.counter = std::stoul(digits);
      rank.stamp.resize(dash);
    }
  }
  return rank;
}

EnvelopeLocator::EnvelopeLocator(const model::GraphDefinition& definition, const storage::ArtifactStore& store, std::string session_root)
    : definition_(definition), store_(store), session_root_(std::move(session_root)), paths_(paths::ResolvePaths(definition)) {
}

const paths::StagePath& EnvelopeLocator::PathOf(const std::string& stage_id) const {
  auto it = paths_.find(stage_id);
  if (it == paths_.end()) {
    throw util::NotFound("unknown stage '" + stage_id + "' in workflow '" + definition_.Name() + "'");
  }
  return it->second;
}

std::string EnvelopeLocator::ContainerOf(const paths::StagePath& path) const {
  return JoinPath(session_root_, ParentOf(path.Nesting()));
}

std::string EnvelopeLocator::CanonicalArtifactPath(const std::string& stage_id) const {
  return JoinPath(session_root_, PathOf(stage_id).artifact_file);
}

std::string EnvelopeLocator::BranchArtifactPath(const std::string& stage_id, const std::string& branch_segment) const {
  const auto& path = PathOf(stage_id);
  return JoinPath(JoinPath(ContainerOf(path), branch_segment), "meta/" + path.ArtifactName());
}

EnvelopeLookup EnvelopeLocator::Latest(const std::string& stage_id) const {
  const auto& path      = PathOf(stage_id);
  const auto  container = ContainerOf(path);

  EnvelopeLookup lookup;
  auto warn = [&](const std::string& at, IntegrityKind kind, const std::string& detail) {
    STAGEGRAPH_LOG_WARN("Envelope integrity problem", {observability::StringField("stage", stage_id), observability::StringField("path", at),
                                                       observability::StringField("kind", ToString(kind)),
                                                       observability::StringField("detail", detail)});
    lookup.warnings.push_back({stage_id, at, kind, detail});
  };

  std::vector<storage::StoreEntry> entries;
  try {
    entries = store_.ListChildren(container);
  } catch (const util::StoreError& e) {
    warn(container, IntegrityKind::kStoreError, e.what());
    return lookup;
  }

  std::vector<BranchRank> candidates;
  for (const auto& entry : entries) {
    if (!entry.is_directory) continue;
    if (auto rank = RankOf(stage_id, entry.name)) {
      candidates.push_back(std::move(*rank));
    }
  }
  std::sort(candidates.begin(), candidates.end(), [](const BranchRank& a, const BranchRank& b) { return b < a; });

  // Newest directory holding an envelope decides. A damaged one leaves the
  // stage without a latest envelope; older ones are superseded.
  for (const auto& candidate : candidates) {
    const auto file = JoinPath(JoinPath(container, candidate.name), "meta/" + path.ArtifactName());

    std::optional<std::string> bytes;
    try {
      bytes = store_.Read(file);
    } catch (const util::StoreError& e) {
      warn(file, IntegrityKind::kStoreError, e.what());
      return lookup;
    }
    if (!bytes) continue;

    ArtifactEnvelope envelope;
    try {
      envelope = DecodeEnvelope(*bytes);
    } catch (const util::ParseError& e) {
      warn(file, IntegrityKind::kCorrupt, e.what());
      return lookup;
    }

    if (envelope.stage() != stage_id) {
      warn(file, IntegrityKind::kCorrupt, "envelope belongs to stage '" + envelope.stage() + "'");
      return lookup;
    }
    if (!fingerprint::Verify(envelope)) {
      warn(file, IntegrityKind::kFingerprintMismatch, "recorded " + envelope.fingerprint());
      return lookup;
    }

    lookup.latest = LocatedEnvelope{std::move(envelope), file};
    return lookup;
  }

  return lookup;
}

} // namespace stagegraph::provenance
