#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace coord::config {

// Absolute locations of everything under the coordination root.
struct ResolvedPaths {
  std::filesystem::path repository;
  std::filesystem::path root;
  std::filesystem::path state_file;
  std::filesystem::path backup_dir;
  std::filesystem::path lock_dir;
  std::filesystem::path checkpoint_dir;
  std::filesystem::path workspace_index_file;
  std::filesystem::path workspace_backup_dir;
  std::filesystem::path worktree_dir;
  std::filesystem::path archive_dir;
  std::filesystem::path audit_db;
};

/*
  Loads RuntimeConfig.

  YAML is converted to JSON then parsed into protobuf, layered over Defaults()
  and finally overridden from COORD_* environment variables.
*/
class ConfigLoader {
 public:
  static coord::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static coord::runtime::config::RuntimeConfig Defaults();

  // Defaults, then the optional file, then the environment. Validated.
  static coord::runtime::config::RuntimeConfig Load(const std::optional<std::string>& path);

  static void ApplyEnvironmentOverrides(coord::runtime::config::RuntimeConfig* config);

  // Throws ConfigurationError.
  static void Validate(const coord::runtime::config::RuntimeConfig& config);

  // Repository is resolved against the working directory, root against the repository,
  // everything else against root.
  static ResolvedPaths ResolvePaths(const coord::runtime::config::RuntimeConfig& config);
};

} // namespace coord::config
