#include <iostream>
#include <optional>
#include <string>

#include "commands.hpp"
#include "internal/cli/exit_codes.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

using coord::cli::Args;

namespace {

int Dispatch(coord::factory::Runtime& rt, const std::string& group, const Args& args) {
  if (group == "state") return coord::cli::RunStateCommand(rt, args);
  if (group == "lock") return coord::cli::RunLockCommand(rt, args);
  if (group == "recovery") return coord::cli::RunRecoveryCommand(rt, args);
  if (group == "workspace") return coord::cli::RunWorkspaceCommand(rt, args);
  throw coord::cli::UsageError("unknown command group: " + group);
}

int Fail(const std::exception& e) {
  const auto diagnostic = coord::cli::ToDiagnostic(e);
  COORD_LOG_ERROR("command failed", {coord::observability::StringField("kind", diagnostic.kind()), coord::observability::StringField("error", e.what())});
  std::cout << coord::util::ToJson(diagnostic) << std::endl;
  return diagnostic.exit_code();
}

} // namespace

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> root;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--root" && i + 1 < argc) {
      root = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      coord::cli::PrintUsage();
      return coord::cli::kExitOk;
    } else {
      break;
    }
  }

  if (argc - i < 2) {
    coord::cli::PrintUsage();
    return coord::cli::kExitGeneric;
  }

  const std::string group = argv[i];
  const Args        args(argv + i + 1, argv + argc);

  // stdout carries command output only; route logging to stderr before anything can fail.
  coord::observability::InitializeLogging(coord::config::ConfigLoader::Defaults());

  int code = coord::cli::kExitGeneric;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = coord::config::ConfigLoader::Load(config_path);
    if (root) {
      config.mutable_paths()->set_root(*root);
    }

    coord::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime and run the command
    // ------------------------------------------------------------
    auto rt = coord::factory::Build(config);
    code    = Dispatch(rt, group, args);
  } catch (const coord::cli::UsageError& e) {
    std::cerr << "coordctl: " << e.what() << "\n\n";
    coord::cli::PrintUsage();
    code = Fail(e);
  } catch (const std::exception& e) {
    code = Fail(e);
  }

  coord::observability::ShutdownLogging();
  return code;
}
