#pragma once

#include <arrow/filesystem/localfs.h>

#include <filesystem>
#include <memory>

#include "internal/storage/artifact_store.hpp"

namespace stagegraph::storage {

/*
  Durable disk storage using Arrow's local filesystem and IO.

  Store paths resolve under `root`.

  Properties:
    - create-or-fail: write a hidden temp file, then hard-link it into
      place; link(2) refuses an existing target
    - readers never see partial files
    - dot-prefixed entries (temp files) are not listed
*/

class DiskArtifactStore final : public ArtifactStore {
public:
  explicit DiskArtifactStore(std::filesystem::path root);

  bool Exists(const std::string& path) const override;

  std::optional<std::string> Read(const std::string& path) const override;

  CreateResult CreateAtomically(const std::string& path,
                                const std::string& bytes) override;

  std::vector<StoreEntry> ListChildren(const std::string& path) const override;

  const std::filesystem::path& root() const { return root_; }

private:
  std::string Resolve(const std::string& path) const;

  std::filesystem::path root_;
  std::shared_ptr<arrow::fs::LocalFileSystem> fs_;
};

}
