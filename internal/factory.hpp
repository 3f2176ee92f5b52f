#pragma once

#include <memory>
#include <string>

#include "internal/model/graph_definition.hpp"
#include "internal/provenance/merkle_engine.hpp"
#include "internal/session/manifest_registry.hpp"
#include "internal/session/session_store.hpp"
#include "internal/storage/artifact_store.hpp"
#include "stagegraph/config/v1/config.pb.h"

namespace stagegraph::factory {

/*
  Application

  Long-lived objects shared by every command of one process.
*/
struct Application {
  storage::ArtifactStorePtr                  store;
  std::shared_ptr<session::SessionStore>     sessions;
  std::shared_ptr<session::ManifestRegistry> registry;
};

/*
  Build

  Composition root: the only place that knows which concrete store
  backend is in use.
*/
Application Build(const stagegraph::config::v1::RuntimeConfig& config);

/*
  Provenance engine for one workflow inside one session tree.
*/
std::unique_ptr<provenance::MerkleEngine> BuildEngine(const Application& app, std::shared_ptr<const model::GraphDefinition> definition,
                                                      const std::string& session_root);

} // namespace stagegraph::factory
