#include "internal/parser/script_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "internal/parser/manifest_parser.hpp"
#include "internal/util/errors.hpp"

namespace {

using stagegraph::model::DefinitionSource;
using stagegraph::model::SkipMarker;
using stagegraph::parser::ParseManifest;
using stagegraph::parser::ParseScript;
using stagegraph::util::ParseError;
using stagegraph::util::TopologyError;

const char* kManifest = R"(name: Pipeline
persona: fedml
stages:
  - id: search
    optional: true
    produces: [search.json]
    parameters:
      limit: 25
      mode: fast
  - id: gather
    previous: search
    produces: [gather.json]
  - id: harmonize
    previous: gather
    produces: [harmonize.json]
    parameters:
      threshold: 0.5
)";

void TestOverridesMergeOverDefaults() {
  const auto manifest = ParseManifest(kManifest);
  const auto script   = ParseScript(R"(name: Quick
manifest: pipeline.manifest.yaml
stages:
  - id: search
    parameters:
      limit: 5
      extra: true
  - id: harmonize
    parameters:
      threshold: 0.7
  - id: harmonize
    parameters:
      threshold: 0.9
)",
                                  manifest);

  assert(script.source() == DefinitionSource::kScript);
  assert(script.Name() == "Quick");

  const auto& search = script.Find("search")->parameters.fields();
  assert(search.at("limit").number_value() == 5);
  assert(search.at("mode").string_value() == "fast");
  assert(search.at("extra").bool_value());

  // Later entries for the same id win.
  assert(script.Find("harmonize")->parameters.fields().at("threshold").number_value() == 0.9);

  assert(script.edges().size() == manifest.edges().size());
  assert(script.root_ids() == manifest.root_ids());
  assert(script.terminal_ids() == manifest.terminal_ids());
}

void TestManifestIsNeverMutated() {
  const auto manifest = ParseManifest(kManifest);
  (void)ParseScript(R"(manifest: pipeline
stages:
  - id: search
    skip: true
    parameters:
      limit: 1
)",
                    manifest);

  const auto* search = manifest.Find("search");
  assert(search->parameters.fields().at("limit").number_value() == 25);
  assert(!search->IsSkipped());
}

void TestSkipSetsTypedMarker() {
  const auto manifest = ParseManifest(kManifest);
  const auto script   = ParseScript(R"(name: NoSearch
manifest: pipeline
stages:
  - id: search
    skip: true
  - id: gather
    skip: false
)",
                                  manifest);

  const auto* search = script.Find("search");
  assert(search->IsSkipped());
  assert(std::get<SkipMarker>(search->directive).reason.find("NoSearch") != std::string::npos);
  assert(search->parameters.fields().count("__skip") == 0);

  assert(!script.Find("gather")->IsSkipped());
  assert(!script.Find("harmonize")->IsSkipped());
}

void TestUnknownOverrideIdsAreNamed() {
  const auto manifest = ParseManifest(kManifest);

  bool threw = false;
  try {
    (void)ParseScript(R"(manifest: pipeline
stages:
  - id: ghost
  - id: search
  - id: phantom
)",
                      manifest);
  } catch (const TopologyError& e) {
    threw = true;
    assert(e.stage_ids() == (std::vector<std::string>{"ghost", "phantom"}));
    assert(std::string(e.what()).find("ghost") != std::string::npos);
  }
  assert(threw);
}

void TestMalformedScriptsAreParseErrors() {
  const auto manifest = ParseManifest(kManifest);

  bool threw = false;
  try {
    (void)ParseScript(R"(name: no anchor
stages:
  - skip: yes
  - id: gather
    skip: sometimes
)",
                      manifest);
  } catch (const ParseError& e) {
    threw = true;
    assert(e.issues().size() == 3);
    assert(e.issues()[0].path == "manifest");
    assert(e.issues()[1].path == "stages.0.id");
    assert(e.issues()[2].path == "stages.1.skip");
  }
  assert(threw);
}

void TestScriptCannotAnchorToScript() {
  const auto manifest = ParseManifest(kManifest);
  const auto script   = ParseScript("manifest: pipeline\n", manifest);

  bool threw = false;
  try {
    (void)ParseScript("manifest: pipeline\n", script);
  } catch (const stagegraph::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestOverridesMergeOverDefaults();
  TestManifestIsNeverMutated();
  TestSkipSetsTypedMarker();
  TestUnknownOverrideIdsAreNamed();
  TestMalformedScriptsAreParseErrors();
  TestScriptCannotAnchorToScript();

  std::cout << "stagegraph_unit_script_parser: pass\n";
  return 0;
}
