#include "disk_artifact_store.hpp"

#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace stagegraph::storage {

using namespace stagegraph::storage::common;

DiskArtifactStore::DiskArtifactStore(std::filesystem::path root)
    : root_(std::filesystem::absolute(std::move(root)).lexically_normal()),
      fs_(std::make_shared<arrow::fs::LocalFileSystem>()) {

  Unwrap(fs_->CreateDir(root_.string(), /*recursive=*/true), "create store root " + root_.string());
}

std::string DiskArtifactStore::Resolve(const std::string& path) const {
  auto full = root_;
  for (const auto& segment : SplitPath(path)) {
    full /= segment;
  }
  return full.string();
}

bool DiskArtifactStore::Exists(const std::string& path) const {
  const auto full = Resolve(path);
  auto info = Unwrap(fs_->GetFileInfo(full), "stat " + full);
  return info.type() != arrow::fs::FileType::NotFound;
}

/*
  Read entire artifact from disk.
*/
std::optional<std::string> DiskArtifactStore::Read(const std::string& path) const {
  const auto full = Resolve(path);

  auto info = Unwrap(fs_->GetFileInfo(full), "stat " + full);
  if (info.type() != arrow::fs::FileType::File) {
    return std::nullopt;
  }

  auto file   = Unwrap(fs_->OpenInputFile(full), "open " + full);
  auto buffer = ReadAll(file, "read " + full);
  return buffer->ToString();
}

/*
  Atomic create:
      write .tmp → close → link(tmp, final) → unlink tmp
*/
CreateResult DiskArtifactStore::CreateAtomically(const std::string& path, const std::string& bytes) {
  const std::filesystem::path final_path = Resolve(path);
  if (final_path == root_) {
    throw util::StoreError("cannot create a file at the store root");
  }

  if (Exists(path)) {
    return CreateResult::kAlreadyExists;
  }

  const auto parent = final_path.parent_path();
  Unwrap(fs_->CreateDir(parent.string(), /*recursive=*/true), "mkdir " + parent.string());

  const auto tmp_path = (parent / ("." + final_path.filename().string() + ".tmp-" + util::ToString(util::GenerateUUID()))).string();
  {
    auto out = Unwrap(fs_->OpenOutputStream(tmp_path), "open " + tmp_path);
    Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())), "write " + tmp_path);
    Unwrap(out->Close(), "close " + tmp_path);
  }

  const int rc          = ::link(tmp_path.c_str(), final_path.c_str());
  const int link_errno  = errno;
  ::unlink(tmp_path.c_str());

  if (rc == 0) {
    return CreateResult::kCreated;
  }
  if (link_errno == EEXIST) {
    return CreateResult::kAlreadyExists;
  }
  throw util::StoreError("link " + final_path.string() + ": " + std::strerror(link_errno));
}

std::vector<StoreEntry> DiskArtifactStore::ListChildren(const std::string& path) const {
  arrow::fs::FileSelector selector;
  selector.base_dir       = Resolve(path);
  selector.allow_not_found = true;
  selector.recursive      = false;

  auto infos = Unwrap(fs_->GetFileInfo(selector), "list " + selector.base_dir);

  std::vector<StoreEntry> entries;
  entries.reserve(infos.size());
  for (const auto& info : infos) {
    const auto name = info.base_name();
    if (name.empty() || name.front() == '.') continue;
    entries.push_back({name, info.type() == arrow::fs::FileType::Directory});
  }

  std::sort(entries.begin(), entries.end(), [](const StoreEntry& a, const StoreEntry& b) { return a.name < b.name; });
  return entries;
}

}
