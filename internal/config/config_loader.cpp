#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <sstream>

#include "internal/util/errors.hpp"
#include "internal/util/path_utils.hpp"

namespace coord::config {

using coord::runtime::config::RuntimeConfig;
using coord::util::ConfigurationError;
using google::protobuf::util::TimeUtil;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1.0" as a schema version)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigurationError("Unsupported YAML node");
  }
}

static int64_t ParseInteger(const char* name, const std::string& raw) {
  size_t  consumed = 0;
  int64_t value    = 0;
  try {
    value = std::stoll(raw, &consumed);
  } catch (const std::exception&) {
    throw ConfigurationError(std::string(name) + " is not an integer: " + raw);
  }
  if (consumed != raw.size() || value < 0) {
    throw ConfigurationError(std::string(name) + " must be a non-negative integer: " + raw);
  }
  return value;
}

static std::optional<std::string> Env(const char* name) {
  if (const char* value = std::getenv(name); value && *value) {
    return std::string(value);
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// YAML documents
// ------------------------------------------------------------

static google::protobuf::Value LoadYamlValue(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);
  return json_value;
}

static RuntimeConfig ValueToConfig(const google::protobuf::Value& json_value) {
  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// Maps merge key by key; scalars and lists from overlay replace.
static void MergeValue(const google::protobuf::Value& overlay, google::protobuf::Value* base) {
  if (overlay.has_struct_value() && base->has_struct_value()) {
    auto* fields = base->mutable_struct_value()->mutable_fields();
    for (const auto& [key, value] : overlay.struct_value().fields()) {
      MergeValue(value, &(*fields)[key]);
    }
    return;
  }
  if (overlay.kind_case() == google::protobuf::Value::kNullValue) {
    return;
  }
  *base = overlay;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  return ValueToConfig(LoadYamlValue(path));
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;

  auto* paths = config.mutable_paths();
  paths->set_root(".coord");
  paths->set_state_file("state.json");
  paths->set_backup_dir("backups");
  paths->set_lock_dir("locks");
  paths->set_checkpoint_dir("checkpoints");
  paths->set_workspace_index_file("workspaces/index.json");
  paths->set_workspace_backup_dir("workspaces/backups");
  paths->set_worktree_dir("worktrees");
  paths->set_archive_dir("archives");
  paths->set_audit_db("audit.db");

  config.mutable_logging()->set_level("info");

  auto* locks                            = config.mutable_locks();
  *locks->mutable_default_timeout()      = TimeUtil::SecondsToDuration(30);
  *locks->mutable_staleness_threshold()  = TimeUtil::SecondsToDuration(300);
  *locks->mutable_initial_backoff()      = TimeUtil::MillisecondsToDuration(10);
  *locks->mutable_max_backoff()          = TimeUtil::MillisecondsToDuration(500);
  auto& priorities                       = *locks->mutable_priorities();
  priorities["trunk"]                    = 5;
  priorities["state"]                    = 10;
  priorities["workspace-index"]          = 20;
  priorities["config"]                   = 30;
  priorities["signals"]                  = 40;
  priorities["backup"]                   = 50;
  priorities["temp"]                     = 60;

  auto* state = config.mutable_state();
  state->set_schema_version("1.0");
  for (const char* phase : {"pre-init", "phase0", "phase1", "phase2", "phase3", "phase4", "phase5", "phase6", "complete"}) {
    state->add_phases(phase);
  }
  state->set_initial_phase("pre-init");
  state->set_backup_retention_count(5);
  *state->mutable_backup_retention_age() = TimeUtil::HoursToDuration(7 * 24);
  state->set_fsync(true);

  auto* checkpoints = config.mutable_checkpoints();
  checkpoints->set_retention_count(20);
  *checkpoints->mutable_retention_age() = TimeUtil::HoursToDuration(7 * 24);

  auto* recovery = config.mutable_recovery();
  recovery->set_max_attempts(3);
  *recovery->mutable_base_delay() = TimeUtil::MillisecondsToDuration(200);
  *recovery->mutable_max_delay()  = TimeUtil::SecondsToDuration(5);

  auto* workspaces = config.mutable_workspaces();
  workspaces->set_repository(".");
  workspaces->set_trunk_branch("main");
  workspaces->set_branch_prefix("workspace/");
  workspaces->set_default_strategy("three-way");
  workspaces->set_completion_marker(".coord-complete");
  workspaces->set_require_completion_marker(false);
  workspaces->set_git_binary("git");
  workspaces->set_commit_name("coordctl");
  workspaces->set_commit_email("coordctl@localhost");

  config.mutable_audit()->set_enabled(true);

  return config;
}

RuntimeConfig ConfigLoader::Load(const std::optional<std::string>& path) {
  auto config = Defaults();

  if (path) {
    google::protobuf::util::JsonPrintOptions print;
    print.preserve_proto_field_names    = true;
    print.always_print_primitive_fields = true;

    std::string defaults_json;
    auto        status = google::protobuf::util::MessageToJsonString(config, &defaults_json, print);
    if (!status.ok()) {
      throw ConfigurationError("Failed to serialize defaults: " + std::string(status.message()));
    }

    google::protobuf::Value merged;
    status = google::protobuf::util::JsonStringToMessage(defaults_json, &merged);
    if (!status.ok()) {
      throw ConfigurationError("Failed to parse defaults: " + std::string(status.message()));
    }

    MergeValue(LoadYamlValue(*path), &merged);
    config = ValueToConfig(merged);
  }

  ApplyEnvironmentOverrides(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig* config) {
  if (auto v = Env("COORD_ROOT")) {
    config->mutable_paths()->set_root(*v);
  }
  if (auto v = Env("COORD_LOCK_TIMEOUT")) {
    *config->mutable_locks()->mutable_default_timeout() = TimeUtil::SecondsToDuration(ParseInteger("COORD_LOCK_TIMEOUT", *v));
  }
  if (auto v = Env("COORD_STALE_LOCK_THRESHOLD")) {
    *config->mutable_locks()->mutable_staleness_threshold() = TimeUtil::SecondsToDuration(ParseInteger("COORD_STALE_LOCK_THRESHOLD", *v));
  }
  if (auto v = Env("COORD_BACKUP_RETENTION_COUNT")) {
    config->mutable_state()->set_backup_retention_count(static_cast<uint32_t>(ParseInteger("COORD_BACKUP_RETENTION_COUNT", *v)));
  }
  if (auto v = Env("COORD_BACKUP_RETENTION_DAYS")) {
    *config->mutable_state()->mutable_backup_retention_age() = TimeUtil::HoursToDuration(24 * ParseInteger("COORD_BACKUP_RETENTION_DAYS", *v));
  }
  if (auto v = Env("COORD_CHECKPOINT_RETENTION_COUNT")) {
    config->mutable_checkpoints()->set_retention_count(static_cast<uint32_t>(ParseInteger("COORD_CHECKPOINT_RETENTION_COUNT", *v)));
  }
  if (auto v = Env("COORD_CHECKPOINT_RETENTION_DAYS")) {
    *config->mutable_checkpoints()->mutable_retention_age() = TimeUtil::HoursToDuration(24 * ParseInteger("COORD_CHECKPOINT_RETENTION_DAYS", *v));
  }
  if (auto v = Env("COORD_MAX_RETRIES")) {
    config->mutable_recovery()->set_max_attempts(static_cast<uint32_t>(ParseInteger("COORD_MAX_RETRIES", *v)));
  }
  if (auto v = Env("COORD_TRUNK_BRANCH")) {
    config->mutable_workspaces()->set_trunk_branch(*v);
  }
  if (auto v = Env("COORD_REPOSITORY")) {
    config->mutable_workspaces()->set_repository(*v);
  }
  if (auto v = Env("COORD_LOG_LEVEL")) {
    config->mutable_logging()->set_level(*v);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.paths().root().empty()) {
    throw ConfigurationError("paths.root must not be empty");
  }

  static const std::set<std::string> kLevels = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
  if (!config.logging().level().empty() && kLevels.count(config.logging().level()) == 0) {
    throw ConfigurationError("logging.level is not a known level: " + config.logging().level());
  }

  if (TimeUtil::DurationToMilliseconds(config.locks().staleness_threshold()) <= 0) {
    throw ConfigurationError("locks.staleness_threshold must be positive");
  }
  if (TimeUtil::DurationToMilliseconds(config.locks().default_timeout()) < 0) {
    throw ConfigurationError("locks.default_timeout must not be negative");
  }
  if (TimeUtil::DurationToMilliseconds(config.locks().initial_backoff()) <= 0 ||
      TimeUtil::DurationToMilliseconds(config.locks().max_backoff()) < TimeUtil::DurationToMilliseconds(config.locks().initial_backoff())) {
    throw ConfigurationError("locks backoff must satisfy 0 < initial_backoff <= max_backoff");
  }
  for (const auto& [resource, priority] : config.locks().priorities()) {
    if (resource.empty() || priority < 0) {
      throw ConfigurationError("locks.priorities entries need a name and a non-negative priority");
    }
  }

  const auto& state = config.state();
  if (state.schema_version().empty()) {
    throw ConfigurationError("state.schema_version must not be empty");
  }
  if (state.phases_size() == 0) {
    throw ConfigurationError("state.phases must not be empty");
  }
  std::set<std::string> phases(state.phases().begin(), state.phases().end());
  if (phases.size() != static_cast<size_t>(state.phases_size())) {
    throw ConfigurationError("state.phases contains duplicates");
  }
  if (phases.count(state.initial_phase()) == 0) {
    throw ConfigurationError("state.initial_phase is not one of state.phases: " + state.initial_phase());
  }
  if (state.backup_retention_count() == 0) {
    throw ConfigurationError("state.backup_retention_count must be at least 1");
  }

  if (config.recovery().max_attempts() == 0) {
    throw ConfigurationError("recovery.max_attempts must be at least 1");
  }

  const auto& ws = config.workspaces();
  if (ws.trunk_branch().empty() || ws.branch_prefix().empty() || ws.git_binary().empty()) {
    throw ConfigurationError("workspaces.trunk_branch, branch_prefix and git_binary are required");
  }
  static const std::set<std::string> kStrategies = {"fast-forward", "three-way", "squash"};
  if (kStrategies.count(ws.default_strategy()) == 0) {
    throw ConfigurationError("workspaces.default_strategy must be fast-forward, three-way or squash");
  }
}

ResolvedPaths ConfigLoader::ResolvePaths(const RuntimeConfig& config) {
  const auto& p = config.paths();

  ResolvedPaths out;
  out.repository           = std::filesystem::absolute(config.workspaces().repository().empty() ? "." : config.workspaces().repository()).lexically_normal();
  out.root                 = coord::util::ResolveAgainst(out.repository, p.root()).lexically_normal();
  out.state_file           = coord::util::ResolveAgainst(out.root, p.state_file());
  out.backup_dir           = coord::util::ResolveAgainst(out.root, p.backup_dir());
  out.lock_dir             = coord::util::ResolveAgainst(out.root, p.lock_dir());
  out.checkpoint_dir       = coord::util::ResolveAgainst(out.root, p.checkpoint_dir());
  out.workspace_index_file = coord::util::ResolveAgainst(out.root, p.workspace_index_file());
  out.workspace_backup_dir = coord::util::ResolveAgainst(out.root, p.workspace_backup_dir());
  out.worktree_dir         = coord::util::ResolveAgainst(out.root, p.worktree_dir());
  out.archive_dir          = coord::util::ResolveAgainst(out.root, p.archive_dir());
  out.audit_db             = coord::util::ResolveAgainst(out.root, p.audit_db());
  return out;
}

} // namespace coord::config
