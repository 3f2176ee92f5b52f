#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using stagegraph::config::ConfigLoader;
using stagegraph::config::v1::StoreConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "stagegraph_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaults() {
  const auto config = ConfigLoader::Defaults();
  assert(config.store().backend_case() == StoreConfig::kMemory);
  assert(config.logging().level() == "info");
  assert(config.session().base_path() == "sessions");
  assert(config.session().manifests_dir() == "manifests");

  const auto empty = ConfigLoader::LoadFromYamlString("");
  assert(empty.store().backend_case() == StoreConfig::kMemory);
}

void TestLocalStoreAndSectionsReplaceDefaults() {
  const auto yaml_path = WriteYaml("local_store",
                                   R"(logging:
  level: debug
store:
  local:
    root_path: "/var/lib/stagegraph"
session:
  base_path: "runs"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.store().backend_case() == StoreConfig::kLocal);
  assert(config.store().local().root_path() == "/var/lib/stagegraph");
  assert(config.session().base_path() == "runs");

  // An explicit section replaces the default one wholesale.
  assert(config.session().manifests_dir().empty());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(store:
  local:
    root_path: "C:\\stagegraph\\\"quoted\"\\root"
)");
  assert(config.store().local().root_path() == "C:\\stagegraph\\\"quoted\"\\root");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(logging:
  pattern: "line1\nline2☃"
)");
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(store:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/stagegraph.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaults();
  TestLocalStoreAndSectionsReplaceDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "stagegraph_unit_config_loader: pass\n";
  return 0;
}
