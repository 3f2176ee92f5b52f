#pragma once

#include <map>
#include <set>
#include <shared_mutex>
#include <string>

#include "internal/storage/artifact_store.hpp"

namespace stagegraph::storage {

/*
  RAM artifact store.

  Files live in a sorted map keyed by normalized path; directories are
  implied by the files beneath them and recorded on creation.

  Thread safety:
    - shared reads
    - exclusive writes, so create-or-fail is atomic
*/

class RamArtifactStore final : public ArtifactStore {
public:
  RamArtifactStore() = default;
  ~RamArtifactStore() override = default;

  // ArtifactStore interface
  bool Exists(const std::string& path) const override;

  std::optional<std::string> Read(const std::string& path) const override;

  CreateResult CreateAtomically(const std::string& path,
                                const std::string& bytes) override;

  std::vector<StoreEntry> ListChildren(const std::string& path) const override;

  std::size_t FileCount() const;

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, std::string> files_;
  std::set<std::string> directories_;
};

} // namespace stagegraph::storage
