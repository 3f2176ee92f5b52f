#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_artifact_store.hpp"
#include "ram/ram_artifact_store.hpp"
#include "internal/observability/logging.hpp"

namespace stagegraph::storage {

using stagegraph::config::v1::StoreConfig;

ArtifactStorePtr StorageFactory::Build(const StoreConfig& cfg) {
  switch (cfg.backend_case()) {
    case StoreConfig::kLocal: {
      std::filesystem::path root =
          cfg.local().root_path().empty() ? std::filesystem::path{"/tmp/stagegraph"} : std::filesystem::path{cfg.local().root_path()};
      STAGEGRAPH_LOG_INFO("Using disk artifact store", {observability::StringField("root", root.string())});
      return std::make_shared<DiskArtifactStore>(std::move(root));
    }

    case StoreConfig::kMemory:
    case StoreConfig::BACKEND_NOT_SET:
    default:
      STAGEGRAPH_LOG_INFO("Using RAM artifact store");
      return std::make_shared<RamArtifactStore>();
  }
}

} // namespace stagegraph::storage
