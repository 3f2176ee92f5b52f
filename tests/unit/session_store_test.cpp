#include "internal/session/manifest_registry.hpp"
#include "internal/session/session_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/storage/ram/ram_artifact_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using stagegraph::session::ManifestRegistry;
using stagegraph::session::SessionStore;
using stagegraph::storage::RamArtifactStore;

void TestCreateResumeList() {
  auto         store = std::make_shared<RamArtifactStore>();
  SessionStore sessions(store, "sessions");

  auto first = sessions.Create("fedml", "1.0.0");
  assert(first.metadata.id().rfind("session-", 0) == 0);
  assert(first.root_path == "sessions/fedml/" + first.metadata.id());
  assert(store->Exists(first.root_path + "/session.json"));

  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  auto second = sessions.Create("fedml", "1.1.0");
  assert(second.metadata.id() != first.metadata.id());

  auto resumed = sessions.Resume("fedml", first.metadata.id());
  assert(resumed.has_value());
  assert(resumed->metadata.manifest_version() == "1.0.0");
  assert(resumed->root_path == first.root_path);

  assert(!sessions.Resume("fedml", "session-missing").has_value());

  auto listed = sessions.List("fedml");
  assert(listed.size() == 2);
  assert(listed[0].metadata.id() == second.metadata.id());
  assert(listed[1].metadata.id() == first.metadata.id());

  assert(sessions.List("chris").empty());
}

void TestListSkipsUnreadableSessions() {
  auto         store = std::make_shared<RamArtifactStore>();
  SessionStore sessions(store, "sessions");

  sessions.Create("fedml", "1.0.0");
  store->CreateAtomically("sessions/fedml/broken/session.json", "not json");
  store->CreateAtomically("sessions/fedml/empty/data/x", "");

  assert(sessions.List("fedml").size() == 1);

  bool threw = false;
  try {
    (void)sessions.Resume("fedml", "broken");
  } catch (const stagegraph::util::ParseError&) {
    threw = true;
  }
  assert(threw);
}

void TestPersonaMustBeOneSegment() {
  SessionStore sessions(std::make_shared<RamArtifactStore>(), "sessions");

  bool threw = false;
  try {
    sessions.Create("a/b", "1");
  } catch (const stagegraph::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void WriteFile(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path);
  out << text;
}

void TestManifestRegistry() {
  const auto dir = std::filesystem::temp_directory_path() / "stagegraph_manifest_registry_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  WriteFile(dir / "fedml.manifest.yaml", R"(name: Federated training
persona: fedml
description: |
  Train a model across sites.
  More detail here.
stages:
  - id: search
    produces: [search.json]
  - id: gather
    previous: search
    produces: [gather.json]
)");
  WriteFile(dir / "broken.manifest.yaml", "name: broken\n");
  WriteFile(dir / "notes.txt", "ignored");

  ManifestRegistry registry(dir);
  assert(registry.List() == (std::vector<std::string>{"broken", "fedml"}));

  const auto definition = registry.Load("fedml");
  assert(definition.size() == 2);

  const auto summaries = registry.Summaries();
  assert(summaries.size() == 1);
  assert(summaries[0].id == "fedml");
  assert(summaries[0].persona == "fedml");
  assert(summaries[0].description == "Train a model across sites.");
  assert(summaries[0].stage_count == 2);

  bool not_found = false;
  try {
    (void)registry.Load("chris");
  } catch (const stagegraph::util::NotFound& e) {
    not_found = true;
    assert(std::string(e.what()).find("fedml") != std::string::npos);
  }
  assert(not_found);

  bool invalid = false;
  try {
    (void)registry.Load("broken");
  } catch (const stagegraph::util::ParseError&) {
    invalid = true;
  }
  assert(invalid);

  assert(ManifestRegistry(dir / "missing").List().empty());

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestCreateResumeList();
  TestListSkipsUnreadableSessions();
  TestPersonaMustBeOneSegment();
  TestManifestRegistry();

  std::cout << "stagegraph_unit_session_store: pass\n";
  return 0;
}
