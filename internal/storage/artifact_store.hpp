#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stagegraph::storage {

/*
  Artifact store abstraction.

  The DAG and provenance code depends on these four primitives only.
  Paths are '/'-separated. Implementations:

    RAM   -> in-process map, used by tests and dry runs
    DISK  -> host filesystem through Arrow

  Backend failures are raised as util::StoreError. Absence is never an
  error: Read returns nullopt and ListChildren returns nothing.
*/

enum class CreateResult {
  kCreated,
  kAlreadyExists,
};

struct StoreEntry {
  std::string name;
  bool        is_directory = false;
};

class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  virtual bool Exists(const std::string& path) const = 0;

  // nullopt for a missing path or a directory.
  virtual std::optional<std::string> Read(const std::string& path) const = 0;

  /*
    Create a file with the given bytes, or fail without touching it if
    anything already exists at `path`. Parent directories are created.
    Readers never observe a partially written file.
  */
  virtual CreateResult CreateAtomically(const std::string& path, const std::string& bytes) = 0;

  // Direct children of a directory, sorted by name.
  virtual std::vector<StoreEntry> ListChildren(const std::string& path) const = 0;
};

using ArtifactStorePtr = std::shared_ptr<ArtifactStore>;

} // namespace stagegraph::storage
