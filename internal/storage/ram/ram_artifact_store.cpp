#include "ram_artifact_store.hpp"

#include <mutex>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace stagegraph::storage {

using namespace stagegraph::storage::common;

bool RamArtifactStore::Exists(const std::string& path) const {
  const auto key = NormalizePath(path);
  std::shared_lock lock(mutex_);

  if (key.empty()) return true;
  return files_.count(key) > 0 || directories_.count(key) > 0;
}

std::optional<std::string> RamArtifactStore::Read(const std::string& path) const {
  const auto key = NormalizePath(path);
  std::shared_lock lock(mutex_);

  auto it = files_.find(key);
  if (it == files_.end()) return std::nullopt;
  return it->second;
}

/*
  Registers every ancestor as a directory. A file standing where a
  directory is needed is a store error, as it would be on disk.
*/
CreateResult RamArtifactStore::CreateAtomically(const std::string& path, const std::string& bytes) {
  const auto key = NormalizePath(path);
  if (key.empty()) {
    throw util::StoreError("cannot create a file at the store root");
  }

  std::unique_lock lock(mutex_);

  if (files_.count(key) || directories_.count(key)) {
    return CreateResult::kAlreadyExists;
  }

  for (auto parent = ParentOf(key); !parent.empty(); parent = ParentOf(parent)) {
    if (files_.count(parent)) {
      throw util::StoreError("not a directory: " + parent);
    }
  }
  for (auto parent = ParentOf(key); !parent.empty(); parent = ParentOf(parent)) {
    directories_.insert(parent);
  }

  files_.emplace(key, bytes);
  return CreateResult::kCreated;
}

std::vector<StoreEntry> RamArtifactStore::ListChildren(const std::string& path) const {
  const auto dir    = NormalizePath(path);
  const auto prefix = dir.empty() ? std::string{} : dir + "/";

  std::shared_lock lock(mutex_);

  std::map<std::string, bool> children;
  auto collect = [&](const std::string& key, bool is_directory) {
    if (key.compare(0, prefix.size(), prefix) != 0) return;
    const auto rest = key.substr(prefix.size());
    if (rest.empty() || rest.find('/') != std::string::npos) return;
    children.emplace(rest, is_directory);
  };

  for (const auto& [key, unused] : files_) collect(key, false);
  for (const auto& key : directories_) collect(key, true);

  std::vector<StoreEntry> entries;
  entries.reserve(children.size());
  for (const auto& [name, is_directory] : children) {
    entries.push_back({name, is_directory});
  }
  return entries;
}

std::size_t RamArtifactStore::FileCount() const {
  std::shared_lock lock(mutex_);
  return files_.size();
}

} // namespace stagegraph::storage
