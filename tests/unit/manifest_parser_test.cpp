#include "internal/parser/manifest_parser.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using stagegraph::model::DefinitionSource;
using stagegraph::model::ManifestHeader;
using stagegraph::parser::ParseManifest;
using stagegraph::util::FieldIssue;
using stagegraph::util::ParseError;

const char* kFederated = R"(name: Federated training
persona: fedml
description: |
  Train across sites.
  Second line.
version: 2.1.0
stages:
  - id: search
    name: Search
    phase: discovery
    optional: true
    produces: [search.json]
    commands: [search <query>]
    parameters:
      limit: 25
      label: "007"
  - id: gather
    previous: search
    produces: [gather.json]
    skip_warning:
      short: Gather first
      reason: Without a cohort nothing downstream works.
  - id: rename
    previous: [gather]
    optional: true
    produces: [rename.json]
  - id: harmonize
    previous: [gather, rename]
    produces: [harmonize.json, report.md]
    handler: harmonize
)";

std::vector<FieldIssue> IssuesOf(const std::string& text) {
  try {
    (void)ParseManifest(text);
  } catch (const ParseError& e) {
    return e.issues();
  }
  assert(false && "expected ParseError");
  return {};
}

bool HasIssue(const std::vector<FieldIssue>& issues, const std::string& path) {
  return std::any_of(issues.begin(), issues.end(), [&](const FieldIssue& issue) { return issue.path == path; });
}

void TestParsesStagesEdgesRootsAndTerminals() {
  const auto definition = ParseManifest(kFederated);

  assert(definition.source() == DefinitionSource::kManifest);
  assert(definition.Name() == "Federated training");
  assert(definition.Version() == "2.1.0");
  assert(std::get<ManifestHeader>(definition.header()).persona == "fedml");

  assert(definition.size() == 4);
  assert(definition.nodes()[0].id == "search");
  assert(definition.nodes()[3].id == "harmonize");

  assert(definition.root_ids() == std::vector<std::string>{"search"});
  assert(definition.terminal_ids() == std::vector<std::string>{"harmonize"});

  assert(definition.edges().size() == 4);
  assert(definition.edges()[0].from == "search" && definition.edges()[0].to == "gather");
  assert(definition.ChildrenOf("gather") == (std::vector<std::string>{"rename", "harmonize"}));
}

void TestStageFieldsAndDefaults() {
  const auto definition = ParseManifest(kFederated);

  const auto* search = definition.Find("search");
  assert(search != nullptr);
  assert(search->IsRoot());
  assert(search->optional);
  assert(search->phase && *search->phase == "discovery");
  assert(search->parameters.fields().at("limit").number_value() == 25);
  assert(search->parameters.fields().at("label").string_value() == "007");

  const auto* gather = definition.Find("gather");
  assert(gather->name == "gather");
  assert(gather->Parents() == std::vector<std::string>{"search"});
  assert(gather->skip_warning && gather->skip_warning->max_warnings == 2);
  assert(gather->skip_warning->short_text == "Gather first");
  assert(!gather->IsSkipped());

  const auto* harmonize = definition.Find("harmonize");
  assert(harmonize->produces.size() == 2);
  assert(harmonize->handler && *harmonize->handler == "harmonize");

  assert(definition.Find("missing") == nullptr);
}

void TestParameterScalarsOnlyConvertDecimalNumbers() {
  const auto definition = ParseManifest(R"(name: Scalars
persona: p
stages:
  - id: a
    produces: [a.json]
    parameters:
      code: 0x1A
      octal: 0o17
      missing: nan
      huge: inf
      overflow: 1e999
      exponent: 1e3
      negative: -2.5
      fraction: .5
      enabled: true
)");

  const auto& fields = definition.Find("a")->parameters.fields();
  assert(fields.at("code").string_value() == "0x1A");
  assert(fields.at("octal").string_value() == "0o17");
  assert(fields.at("missing").string_value() == "nan");
  assert(fields.at("huge").string_value() == "inf");
  assert(fields.at("overflow").string_value() == "1e999");
  assert(fields.at("exponent").number_value() == 1000);
  assert(fields.at("negative").number_value() == -2.5);
  assert(fields.at("fraction").number_value() == 0.5);
  assert(fields.at("enabled").bool_value());
}

void TestAggregatesSchemaViolations() {
  const auto issues = IssuesOf(R"(name: Broken
stages:
  - id: a
    produces: []
  - produces: [b.json]
    optional: maybe
  - id: c
    produces: [c.json]
    handler: Not-Valid
)");

  assert(HasIssue(issues, "persona"));
  assert(HasIssue(issues, "stages.0.produces"));
  assert(HasIssue(issues, "stages.1.id"));
  assert(HasIssue(issues, "stages.1.optional"));
  assert(HasIssue(issues, "stages.2.handler"));
}

void TestStageIdsAndArtifactsMustBePathSegments() {
  const auto issues = IssuesOf(R"(name: Paths
persona: fedml
stages:
  - id: fetch/raw
    produces: [raw.json]
  - id: ..
    produces: [up.json]
  - id: a_BRANCH_x
    produces: [a.json]
  - id: b
    produces: [ok.json, ../escape.json, .hidden]
  - id: c
    produces: [c.json]
)");

  assert(HasIssue(issues, "stages.0.id"));
  assert(HasIssue(issues, "stages.1.id"));
  assert(HasIssue(issues, "stages.2.id"));
  assert(!HasIssue(issues, "stages.3.produces.0"));
  assert(HasIssue(issues, "stages.3.produces.1"));
  assert(HasIssue(issues, "stages.3.produces.2"));
  assert(!HasIssue(issues, "stages.4.id"));
  assert(!HasIssue(issues, "stages.4.produces.0"));
}

void TestDuplicateIdsAreRejected() {
  const auto issues = IssuesOf(R"(name: Dup
persona: p
stages:
  - id: a
    produces: [a.json]
  - id: a
    previous: a
    produces: [a2.json]
)");
  assert(HasIssue(issues, "stages.1.id"));
}

void TestDanglingParentIsRejected() {
  const auto issues = IssuesOf(R"(name: Dangling
persona: p
stages:
  - id: a
    produces: [a.json]
  - id: b
    previous: [a, ghost]
    produces: [b.json]
)");
  assert(HasIssue(issues, "stages.1.previous"));

  bool named = false;
  for (const auto& issue : issues) {
    named = named || issue.message.find("ghost") != std::string::npos;
  }
  assert(named);
}

void TestEmptyPreviousIsRejected() {
  const auto issues = IssuesOf(R"(name: Empty
persona: p
stages:
  - id: a
    produces: [a.json]
  - id: b
    previous: []
    produces: [b.json]
)");
  assert(HasIssue(issues, "stages.1.previous"));
}

void TestCyclesAndMissingRootAreRejected() {
  const auto issues = IssuesOf(R"(name: Loop
persona: p
stages:
  - id: a
    previous: b
    produces: [a.json]
  - id: b
    previous: a
    produces: [b.json]
)");
  assert(HasIssue(issues, "stages"));
  assert(issues.size() >= 2);
}

void TestMalformedYamlIsDocumentError() {
  const auto issues = IssuesOf("name: [unterminated\n");
  assert(issues.size() == 1);
  assert(issues[0].path == "(document)");

  const auto scalar = IssuesOf("just a string");
  assert(scalar.size() == 1 && scalar[0].path == "(document)");
}

void TestMissingStagesIsRejected() {
  const auto issues = IssuesOf("name: x\npersona: p\n");
  assert(HasIssue(issues, "stages"));
}

} // namespace

int main() {
  TestParsesStagesEdgesRootsAndTerminals();
  TestStageFieldsAndDefaults();
  TestParameterScalarsOnlyConvertDecimalNumbers();
  TestAggregatesSchemaViolations();
  TestStageIdsAndArtifactsMustBePathSegments();
  TestDuplicateIdsAreRejected();
  TestDanglingParentIsRejected();
  TestEmptyPreviousIsRejected();
  TestCyclesAndMissingRootAreRejected();
  TestMalformedYamlIsDocumentError();
  TestMissingStagesIsRejected();

  std::cout << "stagegraph_unit_manifest_parser: pass\n";
  return 0;
}
