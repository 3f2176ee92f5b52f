#include "internal/paths/session_paths.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/parser/manifest_parser.hpp"
#include "internal/parser/script_parser.hpp"

namespace {

using stagegraph::model::GraphDefinition;
using stagegraph::model::ManifestHeader;
using stagegraph::model::StageNode;
using stagegraph::parser::ParseManifest;
using stagegraph::parser::ParseScript;
using stagegraph::paths::JoinPath;
using stagegraph::paths::NestingSegments;
using stagegraph::paths::ResolvePaths;

void TestStructuralAncestorIsTransparent() {
  const auto definition = ParseManifest(R"(name: Gate
persona: p
stages:
  - id: root
    produces: [root.json]
  - id: gate
    previous: root
    structural: true
    produces: [gate.json]
  - id: train
    previous: gate
    produces: [model.json]
)");

  const auto paths = ResolvePaths(definition);
  assert(paths.at("train").Nesting() == "root/train");
  assert(paths.at("train").data_dir == "root/train/data");
  assert(paths.at("train").artifact_file == "root/train/meta/model.json");
  assert(paths.at("train").ArtifactName() == "model.json");

  // The structural stage still has a location of its own.
  assert(paths.at("gate").Nesting() == "root/gate");
}

void TestNonRootOptionalAncestorIsTransparent() {
  const auto definition = ParseManifest(R"(name: Bypass
persona: p
stages:
  - id: root
    produces: [root.json]
  - id: rename
    previous: root
    optional: true
    produces: [rename.json]
  - id: required
    previous: rename
    produces: [required.json]
)");

  const auto paths = ResolvePaths(definition);
  assert(paths.at("required").Nesting() == "root/required");
  assert(paths.at("rename").Nesting() == "root/rename");
}

void TestRootOptionalKeepsItsSegment() {
  const auto definition = ParseManifest(R"(name: Scenario
persona: fedml
stages:
  - id: search
    optional: true
    produces: [search.json]
  - id: gather
    previous: search
    produces: [gather.json]
  - id: harmonize
    previous: gather
    produces: [harmonize.json]
)");

  const auto paths = ResolvePaths(definition);
  assert(paths.at("search").Nesting() == "search");
  assert(paths.at("search").artifact_file == "search/meta/search.json");
  assert(paths.at("gather").Nesting() == "search/gather");
  assert(paths.at("harmonize").Nesting() == "search/gather/harmonize");

  // Skipping the root-level optional stage does not move anything.
  const auto script       = ParseScript("manifest: scenario\nstages:\n  - id: search\n    skip: true\n", definition);
  const auto script_paths = ResolvePaths(script);
  assert(script_paths.at("harmonize").Nesting() == "search/gather/harmonize");
}

void TestJoinNestsUnderPrimaryParent() {
  const auto definition = ParseManifest(R"(name: Join
persona: p
stages:
  - id: a
    produces: [a.json]
  - id: b
    produces: [b.json]
  - id: join
    previous: [b, a]
    produces: [join.json]
)");

  const auto paths = ResolvePaths(definition);
  assert(paths.at("join").Nesting() == "b/join");
}

void TestUnknownParentEndsTheWalk() {
  // Only reachable through a hand-built definition; parsed manifests
  // reject dangling parents.
  StageNode root;
  root.id       = "root";
  root.produces = {"root.json"};

  StageNode orphan;
  orphan.id       = "orphan";
  orphan.previous = std::vector<std::string>{"ghost"};

  StageNode child;
  child.id       = "child";
  child.previous = std::vector<std::string>{"orphan"};
  child.produces = {"child.json"};

  GraphDefinition definition(stagegraph::model::DefinitionSource::kManifest, ManifestHeader{}, {root, orphan, child},
                             {{"orphan", "child"}}, {"root"}, {"root", "child"});

  const auto paths = ResolvePaths(definition);
  assert(paths.at("child").Nesting() == "orphan/child");

  // No produces: the artifact falls back to <id>.json.
  assert(paths.at("orphan").artifact_file == "orphan/meta/orphan.json");
}

void TestCyclicPrimaryChainTerminates() {
  StageNode a;
  a.id       = "a";
  a.previous = std::vector<std::string>{"b"};
  a.produces = {"a.json"};

  StageNode b;
  b.id       = "b";
  b.previous = std::vector<std::string>{"a"};
  b.produces = {"b.json"};

  GraphDefinition definition(stagegraph::model::DefinitionSource::kManifest, ManifestHeader{}, {a, b}, {{"b", "a"}, {"a", "b"}}, {}, {});

  assert(NestingSegments(definition, *definition.Find("a")) == (std::vector<std::string>{"b", "a"}));
}

void TestJoinPath() {
  assert(JoinPath("", "a") == "a");
  assert(JoinPath("s", "") == "s");
  assert(JoinPath("s/", "a") == "s/a");
  assert(JoinPath("s", "a/b") == "s/a/b");
}

} // namespace

int main() {
  TestStructuralAncestorIsTransparent();
  TestNonRootOptionalAncestorIsTransparent();
  TestRootOptionalKeepsItsSegment();
  TestJoinNestsUnderPrimaryParent();
  TestUnknownParentEndsTheWalk();
  TestCyclicPrimaryChainTerminates();
  TestJoinPath();

  std::cout << "stagegraph_unit_session_paths: pass\n";
  return 0;
}
