#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/fingerprint/chain.hpp"
#include "internal/observability/logging.hpp"
#include "internal/parser/manifest_parser.hpp"
#include "internal/parser/script_parser.hpp"
#include "internal/paths/session_paths.hpp"
#include "internal/readiness/readiness_engine.hpp"
#include "internal/session/manifest_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/workflow/workflow_guard.hpp"

using namespace stagegraph;

static void Usage() {
  std::cout << "Usage:\n"
            << "  stagectl [--config <file.yaml>] [--script <file.yaml>] <command> ...\n"
            << "\n"
            << "  <workflow> is a manifest file or a workflow id from the manifests directory.\n"
            << "\n"
            << "  stagectl validate <workflow>\n"
            << "  stagectl paths <workflow>\n"
            << "  stagectl status <workflow> <session_root>\n"
            << "  stagectl materialize <workflow> <session_root> <stage> <content.json|->\n"
            << "  stagectl skip <workflow> <session_root> <stage> [reason]\n"
            << "  stagectl verify <workflow> <session_root>\n"
            << "  stagectl workflows\n"
            << "  stagectl sessions <persona>\n"
            << "  stagectl new-session <persona> [manifest_version]\n";
}

static std::shared_ptr<const model::GraphDefinition> LoadWorkflow(const factory::Application& app, const std::string& workflow,
                                                                  const std::optional<std::string>& script_path) {
  auto manifest = std::filesystem::is_regular_file(workflow) ? parser::ParseManifest(session::ReadTextFile(workflow))
                                                             : app.registry->Load(workflow);
  if (!script_path) {
    return std::make_shared<const model::GraphDefinition>(std::move(manifest));
  }
  return std::make_shared<const model::GraphDefinition>(parser::ParseScript(session::ReadTextFile(*script_path), manifest));
}

static google::protobuf::Struct LoadContent(const std::string& source) {
  std::string json;
  if (source == "-") {
    json.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    json = session::ReadTextFile(source);
  }

  google::protobuf::Struct content;
  auto status = google::protobuf::util::JsonStringToMessage(json, &content);
  if (!status.ok()) {
    throw util::ParseError("Invalid content", {{source, status.ToString()}});
  }
  return content;
}

static void PrintWarnings(const std::vector<readiness::IntegrityWarning>& warnings) {
  for (const auto& w : warnings) {
    std::cerr << "warning: " << provenance::ToString(w.kind) << " " << w.stage << " " << w.path << ": " << w.detail << "\n";
  }
}

static int Run(const std::string& cmd, const std::vector<std::string>& args, const factory::Application& app,
               const std::optional<std::string>& script_path) {

  // ------------------------------------------------------------

  if (cmd == "validate") {
    if (args.size() < 1) return 1;

    auto definition = LoadWorkflow(app, args[0], script_path);

    std::cout << "ok: " << definition->Name() << " " << definition->Version() << "\n";
    std::cout << "stages=" << definition->size() << " edges=" << definition->edges().size() << "\n";
    std::cout << "roots=";
    for (const auto& id : definition->root_ids()) std::cout << id << " ";
    std::cout << "\nterminals=";
    for (const auto& id : definition->terminal_ids()) std::cout << id << " ";
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "paths") {
    if (args.size() < 1) return 1;

    auto       definition = LoadWorkflow(app, args[0], script_path);
    const auto paths      = paths::ResolvePaths(*definition);

    for (const auto& node : definition->nodes()) {
      const auto& path = paths.at(node.id);
      std::cout << node.id << "\t" << path.data_dir << "\t" << path.artifact_file << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (args.size() < 2) return 1;

    auto definition = LoadWorkflow(app, args[0], script_path);
    auto position   = readiness::ResolvePosition(*definition, *app.store, args[1]);

    std::cout << workflow::RenderProgress(*definition, position);
    if (position.current_stage) {
      std::cout << "\nnext=" << *position.current_stage;
      if (position.progress.phase) std::cout << " phase=" << *position.progress.phase;
      std::cout << "\n";
      if (!position.next_instruction.empty()) std::cout << position.next_instruction << "\n";
    }
    std::cout << "complete=" << (position.is_complete ? "true" : "false") << "\n";

    PrintWarnings(position.warnings);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "materialize") {
    if (args.size() < 4) return 1;

    auto definition = LoadWorkflow(app, args[0], script_path);
    auto engine     = factory::BuildEngine(app, definition, args[1]);
    auto result     = engine->Materialize(args[2], LoadContent(args[3]));

    std::cout << "fingerprint=" << result.envelope.fingerprint() << "\n";
    std::cout << "path=" << result.path << (result.branched ? " (branch)" : "") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "skip") {
    if (args.size() < 3) return 1;

    auto definition = LoadWorkflow(app, args[0], script_path);
    auto engine     = factory::BuildEngine(app, definition, args[1]);
    auto result     = engine->MaterializeSkip(args[2], args.size() >= 4 ? args[3] : std::string{});

    std::cout << "skipped " << args[2] << "\n";
    std::cout << "path=" << result.path << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "verify") {
    if (args.size() < 2) return 1;

    auto definition = LoadWorkflow(app, args[0], script_path);

    std::vector<readiness::IntegrityWarning> warnings;
    provenance::EnvelopeLocator             locator(*definition, *app.store, args[1]);

    auto chain = fingerprint::ValidateChain(*definition, [&](const std::string& stage_id) -> std::optional<fingerprint::FingerprintRecord> {
      auto lookup = locator.Latest(stage_id);
      warnings.insert(warnings.end(), lookup.warnings.begin(), lookup.warnings.end());
      if (!lookup.latest) return std::nullopt;
      return fingerprint::FingerprintRecord{lookup.latest->envelope.fingerprint(), fingerprint::ParentsOf(lookup.latest->envelope)};
    });

    for (const auto& stale : chain.stale_stages) {
      std::cout << "stale " << stale.stage_id << " <-";
      for (const auto& parent : stale.stale_parents) std::cout << " " << parent;
      std::cout << "\n";
    }
    for (const auto& missing : chain.missing_stages) {
      std::cout << "missing " << missing << "\n";
    }
    PrintWarnings(warnings);

    std::cout << (chain.valid && warnings.empty() ? "valid" : "invalid") << "\n";
    return chain.valid && warnings.empty() ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "workflows") {
    for (const auto& summary : app.registry->Summaries()) {
      std::cout << summary.id << "\t" << summary.name << "\tpersona=" << summary.persona << "\tstages=" << summary.stage_count << "\n";
      if (!summary.description.empty()) std::cout << "  " << summary.description << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sessions") {
    if (args.size() < 1) return 1;

    for (const auto& s : app.sessions->List(args[0])) {
      std::cout << s.metadata.id() << "\t" << s.metadata.last_active() << "\t" << s.root_path << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "new-session") {
    if (args.size() < 1) return 1;

    auto s = app.sessions->Create(args[0], args.size() >= 2 ? args[1] : "1.0.0");
    std::cout << "session=" << s.metadata.id() << "\n";
    std::cout << "root=" << s.root_path << "\n";
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> script_path;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--script" && i + 1 < argc) {
      script_path = argv[++i];
    } else {
      break;
    }
  }

  if (i >= argc) {
    Usage();
    return 1;
  }

  const std::string        cmd = argv[i];
  std::vector<std::string> args(argv + i + 1, argv + argc);

  try {
    auto config = config_path ? config::ConfigLoader::LoadFromYaml(*config_path) : config::ConfigLoader::Defaults();
    observability::InitializeLogging(config);

    auto app = factory::Build(config);

    const int rc = Run(cmd, args, app, script_path);
    if (rc == 1) Usage();

    observability::ShutdownLogging();
    return rc;
  } catch (const util::ParseError& e) {
    std::cerr << e.what() << "\n";
    for (const auto& issue : e.issues()) {
      std::cerr << "  " << issue.path << ": " << issue.message << "\n";
    }
  } catch (const util::TopologyError& e) {
    std::cerr << e.what() << "\n";
  } catch (const std::exception& e) {
    STAGEGRAPH_LOG_ERROR("Command failed", {observability::StringField("command", cmd), observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
  }

  observability::ShutdownLogging();
  return 2;
}
