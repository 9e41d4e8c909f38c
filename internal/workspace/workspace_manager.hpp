#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "coord/v1/report.pb.h"
#include "coord/v1/workspace.pb.h"
#include "internal/audit/audit_trail.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/recovery/recovery_manager.hpp"
#include "internal/state/state_store.hpp"
#include "vcs_backend.hpp"
#include "workspace_index.hpp"
#include "workspace_state.hpp"

namespace coord::workspace {

struct WorkspaceOptions {
  std::filesystem::path repository; // trunk checkout
  std::filesystem::path worktree_dir;
  std::filesystem::path archive_dir;
  std::filesystem::path coord_root; // never counted as a trunk modification

  std::string   trunk_branch     = "main";
  std::string   branch_prefix    = "workspace/";
  MergeStrategy default_strategy = coord::v1::MERGE_STRATEGY_THREE_WAY;

  std::string completion_marker         = ".coord-complete";
  bool        require_completion_marker = false;

  std::optional<std::chrono::milliseconds> trunk_lock_timeout;
};

struct CreateOptions {
  std::vector<std::string> scope;      // allowed path prefixes, empty = anywhere
  std::vector<std::string> depends_on; // workspace names merged first
};

struct ListFilter {
  std::optional<WorkspaceStatus> status;
  bool                           include_history = false;
};

/*
  WorkspaceManager

  One git worktree per task, branched from trunk and merged back under the
  "trunk" lock.

      create → active → validating → merged → archived
                  ↑          │
                  └─ conflict┘   (resolve / abort)
      active | validating | conflict → failed   (forced cleanup, repair)

  The index is only mutated through WorkspaceIndexStore::Write. Operations that
  must keep the index consistent with git do their git work inside the write
  mutator so both happen under the "workspace-index" lock.
*/
class WorkspaceManager {
 public:
  static constexpr char kTrunkLockResource[] = "trunk";

  WorkspaceManager(WorkspaceOptions                           options,
                   std::shared_ptr<VcsBackend>                vcs,
                   std::shared_ptr<WorkspaceIndexStore>       index,
                   std::shared_ptr<state::StateStore>         state,
                   std::shared_ptr<lock::LockManager>         locks,
                   std::shared_ptr<recovery::RecoveryManager> recovery,
                   std::shared_ptr<audit::AuditTrail>         audit);

  // Workspace name for a task key. Throws ValidationFailed when nothing usable remains.
  static std::string NameFor(const std::string& task_key);

  // Throws AlreadyExists when a live workspace (or its branch or directory) exists.
  coord::v1::WorkspaceRecord Create(const std::string& task_key, const std::string& base_point = {}, const CreateOptions& options = {});

  // Throws WorkspaceNotFound.
  coord::v1::WorkspaceRecord Get(const std::string& name);

  std::vector<coord::v1::WorkspaceRecord> List(const ListFilter& filter = {});

  // Throws DirtyState, IsolationViolation, ValidationFailed. Refreshes changedPaths.
  coord::v1::ValidationReport Validate(const std::string& name);

  // Throws MergeConflict (record left in conflict, trunk untouched).
  coord::v1::WorkspaceRecord Merge(const std::string& name, std::optional<MergeStrategy> strategy = std::nullopt);

  coord::v1::WorkspaceRecord AcceptOurs(const std::string& name, const std::string& path);
  coord::v1::WorkspaceRecord AcceptTheirs(const std::string& name, const std::string& path);
  coord::v1::WorkspaceRecord ProvideResolved(const std::string& name, const std::string& path, const std::string& content);

  // Drops an in-progress resolution and returns a conflicted workspace to active.
  coord::v1::WorkspaceRecord Abort(const std::string& name);

  coord::v1::WorkspaceRecord Cleanup(const std::string& name, bool archive, bool force);

  coord::v1::RepairReport Repair();

  const WorkspaceOptions& Options() const {
    return options_;
  }

 private:
  using Apply = std::function<void(const std::filesystem::path& checkout)>;

  coord::v1::WorkspaceRecord Resolve(const std::string& name, const std::string& path, const std::string& how, const Apply& apply);

  // Checks that do not mutate anything. Throws on the first violated rule.
  coord::v1::ValidationReport Inspect(const coord::v1::WorkspaceRecord& record);

  void CheckDependencies(const coord::v1::WorkspaceRecord& record, const coord::v1::WorkspaceIndex& index);
  void CheckDisjoint(const coord::v1::WorkspaceRecord& record, const std::vector<std::string>& changed, const coord::v1::WorkspaceIndex& index);

  // Moves a record out of validating after a failed merge; failures are logged.
  void SettleFailedMerge(const std::string& name, const std::vector<std::string>& conflicts, const std::string& reason);

  bool IsRegisteredWorktree(const std::filesystem::path& path);

  std::vector<std::string> TrunkExclusions() const;

  lock::ScopedLease LockTrunk(const std::string& purpose);

  void RequireFeature(const std::string& feature);

  void Audit(const std::string& action, const std::string& name, const std::string& outcome, const std::string& detail = {});

  WorkspaceOptions                           options_;
  std::shared_ptr<VcsBackend>                vcs_;
  std::shared_ptr<WorkspaceIndexStore>       index_;
  std::shared_ptr<state::StateStore>         state_;
  std::shared_ptr<lock::LockManager>         locks_;
  std::shared_ptr<recovery::RecoveryManager> recovery_;
  std::shared_ptr<audit::AuditTrail>         audit_;
};

} // namespace coord::workspace
