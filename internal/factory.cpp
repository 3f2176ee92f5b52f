#include "factory.hpp"

#include "internal/observability/logging.hpp"
#include "internal/storage/storage_factory.hpp"

namespace stagegraph::factory {

Application Build(const stagegraph::config::v1::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage backend
  // ------------------------------------------------------------------
  app.store = storage::StorageFactory::Build(config.store());

  // ------------------------------------------------------------------
  // Sessions and manifests
  // ------------------------------------------------------------------
  app.sessions = std::make_shared<session::SessionStore>(app.store, config.session().base_path());
  app.registry = std::make_shared<session::ManifestRegistry>(config.session().manifests_dir());

  STAGEGRAPH_LOG_DEBUG("Application built", {observability::StringField("sessions", config.session().base_path()),
                                             observability::StringField("manifests", config.session().manifests_dir())});
  return app;
}

std::unique_ptr<provenance::MerkleEngine> BuildEngine(const Application& app, std::shared_ptr<const model::GraphDefinition> definition,
                                                      const std::string& session_root) {
  return std::make_unique<provenance::MerkleEngine>(std::move(definition), app.store, session_root);
}

} // namespace stagegraph::factory
