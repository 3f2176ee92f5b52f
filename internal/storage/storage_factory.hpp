#pragma once

#include "internal/storage/artifact_store.hpp"
#include "stagegraph/config/v1/config.pb.h"

namespace stagegraph::storage {

/*
  Builds the artifact store named by configuration.

      store: { memory: {} }                      -> RamArtifactStore
      store: { local: { root_path: /var/sg } }   -> DiskArtifactStore

  An empty store section selects RAM.
*/

class StorageFactory {
public:
  static ArtifactStorePtr Build(const stagegraph::config::v1::StoreConfig& cfg);
};

} // namespace stagegraph::storage
