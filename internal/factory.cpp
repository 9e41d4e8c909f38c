#include "factory.hpp"

#include <google/protobuf/util/time_util.h>

#include <memory>
#include <string>

#include "internal/audit/sqlite_audit_trail.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/state_schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/workspace/git_backend.hpp"

namespace coord::factory {

using coord::runtime::config::RuntimeConfig;
using google::protobuf::util::TimeUtil;

namespace {

std::chrono::milliseconds Millis(const google::protobuf::Duration& duration) {
  return std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(duration));
}

std::shared_ptr<audit::AuditTrail> BuildAudit(const RuntimeConfig& config, const config::ResolvedPaths& paths) {
  if (!config.audit().enabled()) {
    return std::make_shared<audit::NullAuditTrail>();
  }
  try {
    util::EnsureDirectory(paths.audit_db.parent_path());
    return std::make_shared<audit::SqliteAuditTrail>(std::make_shared<db::sqlite::SqliteDB>(paths.audit_db.string()));
  } catch (const util::CoordError& e) {
    COORD_LOG_WARN("audit database unavailable; continuing without audit trail",
                   {observability::StringField("path", paths.audit_db.string()), observability::StringField("error", e.what())});
    return std::make_shared<audit::NullAuditTrail>();
  }
}

} // namespace

Runtime Build(const RuntimeConfig& config) {
  const auto paths = config::ConfigLoader::ResolvePaths(config);
  return Build(config, BuildAudit(config, paths));
}

Runtime Build(const RuntimeConfig& config, std::shared_ptr<audit::AuditTrail> audit) {
  Runtime rt;
  rt.config = config;
  rt.paths  = config::ConfigLoader::ResolvePaths(config);
  rt.audit  = audit ? std::move(audit) : std::make_shared<audit::NullAuditTrail>();

  // ------------------------------------------------------------------
  // Locks
  // ------------------------------------------------------------------
  const auto&       locks_cfg = config.locks();
  lock::LockOptions lock_options;
  lock_options.lock_dir            = rt.paths.lock_dir;
  lock_options.default_timeout     = Millis(locks_cfg.default_timeout());
  lock_options.staleness_threshold = Millis(locks_cfg.staleness_threshold());
  lock_options.initial_backoff     = Millis(locks_cfg.initial_backoff());
  lock_options.max_backoff         = Millis(locks_cfg.max_backoff());
  for (const auto& [resource, priority] : locks_cfg.priorities()) {
    lock_options.priorities[resource] = priority;
  }
  rt.locks = std::make_shared<lock::LockManager>(std::move(lock_options), rt.audit);

  // ------------------------------------------------------------------
  // State
  // ------------------------------------------------------------------
  const auto& state_cfg = config.state();
  auto        schema    = std::make_shared<const state::StateSchema>(state_cfg.schema_version(),
                                                                    std::vector<std::string>(state_cfg.phases().begin(), state_cfg.phases().end()),
                                                                    state_cfg.initial_phase());

  state::DocumentStoreOptions state_options;
  state_options.name            = state::StateStore::kLockResource;
  state_options.file            = rt.paths.state_file;
  state_options.backup_dir      = rt.paths.backup_dir;
  state_options.backup_prefix   = "state";
  state_options.retention_count = state_cfg.backup_retention_count();
  state_options.retention_age   = Millis(state_cfg.backup_retention_age());
  state_options.fsync           = state_cfg.fsync();
  rt.state = std::make_shared<state::StateStore>(state_options, schema, rt.locks, rt.audit);

  // ------------------------------------------------------------------
  // Checkpoints and recovery
  // ------------------------------------------------------------------
  rt.checkpoints = std::make_shared<recovery::CheckpointStore>(rt.paths.checkpoint_dir, rt.state, rt.audit);

  recovery::RecoveryOptions recovery_options;
  recovery_options.max_attempts               = config.recovery().max_attempts();
  recovery_options.base_delay                 = Millis(config.recovery().base_delay());
  recovery_options.max_delay                  = Millis(config.recovery().max_delay());
  recovery_options.checkpoint_retention_count = config.checkpoints().retention_count();
  recovery_options.checkpoint_retention_age   = Millis(config.checkpoints().retention_age());
  rt.recovery = std::make_shared<recovery::RecoveryManager>(recovery_options, rt.state, rt.checkpoints, rt.locks, rt.audit);

  // ------------------------------------------------------------------
  // Workspaces
  // ------------------------------------------------------------------
  state::DocumentStoreOptions index_options = state_options;
  index_options.file                        = rt.paths.workspace_index_file;
  index_options.backup_dir                  = rt.paths.workspace_backup_dir;
  index_options.backup_prefix               = "index";
  rt.workspace_index = workspace::MakeIndexStore(index_options, rt.locks, rt.audit);

  const auto&          ws_cfg = config.workspaces();
  workspace::GitOptions git;
  git.repository   = rt.paths.repository;
  git.git_binary   = ws_cfg.git_binary();
  git.commit_name  = ws_cfg.commit_name();
  git.commit_email = ws_cfg.commit_email();

  workspace::WorkspaceOptions ws_options;
  ws_options.repository                = rt.paths.repository;
  ws_options.worktree_dir              = rt.paths.worktree_dir;
  ws_options.archive_dir               = rt.paths.archive_dir;
  ws_options.coord_root                = rt.paths.root;
  ws_options.trunk_branch              = ws_cfg.trunk_branch();
  ws_options.branch_prefix             = ws_cfg.branch_prefix();
  ws_options.default_strategy          = workspace::ParseStrategy(ws_cfg.default_strategy());
  ws_options.completion_marker         = ws_cfg.completion_marker();
  ws_options.require_completion_marker = ws_cfg.require_completion_marker();

  rt.workspaces = std::make_shared<workspace::WorkspaceManager>(ws_options, std::make_shared<workspace::GitCliBackend>(std::move(git)), rt.workspace_index,
                                                                rt.state, rt.locks, rt.recovery, rt.audit);

  COORD_LOG_DEBUG("runtime built", {observability::StringField("root", rt.paths.root.string()),
                                    observability::StringField("repository", rt.paths.repository.string())});
  return rt;
}

} // namespace coord::factory
