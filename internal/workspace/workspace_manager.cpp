#include "workspace_manager.hpp"

#include <algorithm>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/json.hpp"
#include "internal/util/path_utils.hpp"
#include "internal/util/process.hpp"
#include "internal/util/time.hpp"

namespace coord::workspace {

using coord::v1::WorkspaceIndex;
using coord::v1::WorkspaceRecord;

namespace {

std::filesystem::path Canonical(const std::filesystem::path& path) {
  std::error_code ec;
  auto            out = std::filesystem::weakly_canonical(path, ec);
  if (ec) return std::filesystem::absolute(path).lexically_normal();
  return out;
}

// Relative, normalized repository path without a trailing slash.
std::string NormalizeRepoPath(const std::string& raw, const char* what) {
  if (raw.empty()) {
    throw util::ValidationFailed(std::string(what) + " must not be empty");
  }
  std::filesystem::path path(raw);
  if (path.is_absolute()) {
    throw util::ValidationFailed(std::string(what) + " must be relative to the repository: " + raw);
  }
  auto normal = path.lexically_normal().generic_string();
  while (!normal.empty() && normal.back() == '/') normal.pop_back();
  if (normal.empty() || normal == "." || normal == ".." || normal.rfind("../", 0) == 0) {
    throw util::ValidationFailed(std::string(what) + " escapes the repository: " + raw);
  }
  return normal;
}

bool WithinScope(const std::string& path, const google::protobuf::RepeatedPtrField<std::string>& scope) {
  if (scope.empty()) return true;
  for (const auto& prefix : scope) {
    if (path == prefix || path.rfind(prefix + "/", 0) == 0) return true;
  }
  return false;
}

bool Contains(const google::protobuf::RepeatedPtrField<std::string>& list, const std::string& value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

WorkspaceRecord* FindRecord(WorkspaceIndex* index, const std::string& name) {
  auto it = index->mutable_workspaces()->find(name);
  if (it == index->mutable_workspaces()->end()) {
    throw util::WorkspaceNotFound("workspace not found: " + name);
  }
  return &it->second;
}

void Transition(WorkspaceRecord* record, WorkspaceStatus to) {
  if (!CanTransition(record->status(), to)) {
    throw util::InvalidState("workspace " + record->name() + " cannot go from " + std::string(ToString(record->status())) + " to " +
                             std::string(ToString(to)));
  }
  record->set_status(to);
  *record->mutable_last_activity_at() = util::ToProto(util::Now());
}

void SetPaths(google::protobuf::RepeatedPtrField<std::string>* field, const std::vector<std::string>& paths) {
  field->Clear();
  for (const auto& path : paths) *field->Add() = path;
}

} // namespace

WorkspaceManager::WorkspaceManager(WorkspaceOptions                           options,
                                   std::shared_ptr<VcsBackend>                vcs,
                                   std::shared_ptr<WorkspaceIndexStore>       index,
                                   std::shared_ptr<state::StateStore>         state,
                                   std::shared_ptr<lock::LockManager>         locks,
                                   std::shared_ptr<recovery::RecoveryManager> recovery,
                                   std::shared_ptr<audit::AuditTrail>         audit)
    : options_(std::move(options)),
      vcs_(std::move(vcs)),
      index_(std::move(index)),
      state_(std::move(state)),
      locks_(std::move(locks)),
      recovery_(std::move(recovery)),
      audit_(audit ? std::move(audit) : std::make_shared<audit::NullAuditTrail>()) {
  options_.repository   = Canonical(options_.repository);
  options_.worktree_dir = Canonical(options_.worktree_dir);
  options_.archive_dir  = Canonical(options_.archive_dir);
  options_.coord_root   = Canonical(options_.coord_root);
}

std::string WorkspaceManager::NameFor(const std::string& task_key) {
  auto name = util::Sanitize(task_key);
  if (name.empty()) {
    throw util::ValidationFailed("task key yields an empty workspace name: '" + task_key + "'");
  }
  return name;
}

WorkspaceRecord WorkspaceManager::Create(const std::string& task_key, const std::string& base_point, const CreateOptions& create) {
  RequireFeature("workspace-create");

  const auto name     = NameFor(task_key);
  const auto branch   = options_.branch_prefix + name;
  const auto path     = options_.worktree_dir / name;
  const auto base_ref = base_point.empty() ? options_.trunk_branch : base_point;

  std::vector<std::string> scope;
  for (const auto& prefix : create.scope) scope.push_back(NormalizeRepoPath(prefix, "scope"));
  std::vector<std::string> depends_on;
  for (const auto& dep : create.depends_on) {
    const auto dep_name = NameFor(dep);
    if (dep_name == name) {
      throw util::ValidationFailed("workspace " + name + " cannot depend on itself");
    }
    depends_on.push_back(dep_name);
  }

  bool            added = false;
  WorkspaceRecord created;
  try {
    index_->Write(
        [&](WorkspaceIndex* index) {
          auto& workspaces = *index->mutable_workspaces();
          auto  existing   = workspaces.find(name);
          if (existing != workspaces.end()) {
            if (IsLive(existing->second.status())) {
              throw util::AlreadyExists("workspace already exists: " + name + " (" + std::string(ToString(existing->second.status())) + ")");
            }
            *index->add_history() = existing->second;
            workspaces.erase(existing);
          }
          if (vcs_->BranchExists(branch)) {
            throw util::AlreadyExists("branch already exists: " + branch);
          }
          if (std::filesystem::exists(path)) {
            throw util::AlreadyExists("workspace directory already exists: " + path.string());
          }

          const auto commit = vcs_->ResolveCommit(options_.repository, base_ref);
          vcs_->AddWorktree(path, branch, commit);
          added = true;

          const auto now = util::ToProto(util::Now());
          WorkspaceRecord record;
          record.set_name(name);
          record.set_task_key(task_key);
          record.set_status(coord::v1::WORKSPACE_STATUS_ACTIVE);
          record.set_base_point(commit);
          record.set_base_ref(base_ref);
          record.set_branch(branch);
          record.set_path(path.string());
          *record.mutable_created_at()       = now;
          *record.mutable_last_activity_at() = now;
          record.set_merge_status(coord::v1::MERGE_STATUS_PENDING);
          record.set_strategy(options_.default_strategy);
          SetPaths(record.mutable_scope(), scope);
          SetPaths(record.mutable_depends_on(), depends_on);

          workspaces[name] = record;
          created          = record;
        },
        "create-" + name);
  } catch (const std::exception& e) {
    if (added) {
      COORD_LOG_WARN("rolling back workspace after failed index write", {observability::StringField("workspace", name), observability::StringField("error", e.what())});
      try {
        vcs_->RemoveWorktree(path, true);
        vcs_->DeleteBranch(branch);
      } catch (const util::CoordError& rollback) {
        COORD_LOG_ERROR("workspace rollback failed", {observability::StringField("workspace", name), observability::StringField("error", rollback.what())});
      }
    }
    Audit("create", name, "failed", e.what());
    throw;
  }

  Audit("create", name, "created", created.base_point());
  COORD_LOG_INFO("workspace created", {observability::StringField("workspace", name), observability::StringField("branch", branch),
                                       observability::StringField("base", created.base_point())});
  return created;
}

WorkspaceRecord WorkspaceManager::Get(const std::string& name) {
  auto index = index_->Read().document;
  return *FindRecord(&index, name);
}

std::vector<WorkspaceRecord> WorkspaceManager::List(const ListFilter& filter) {
  const auto index = index_->Read().document;

  std::vector<WorkspaceRecord> out;
  for (const auto& [name, record] : index.workspaces()) {
    if (filter.status && record.status() != *filter.status) continue;
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const WorkspaceRecord& a, const WorkspaceRecord& b) { return a.name() < b.name(); });

  if (filter.include_history) {
    for (const auto& record : index.history()) {
      if (filter.status && record.status() != *filter.status) continue;
      out.push_back(record);
    }
  }
  return out;
}

coord::v1::ValidationReport WorkspaceManager::Validate(const std::string& name) {
  const auto record = Get(name);
  if (IsTerminal(record.status())) {
    throw util::InvalidState("workspace " + name + " is " + std::string(ToString(record.status())));
  }

  auto report = Inspect(record);

  index_->Write(
      [&](WorkspaceIndex* index) {
        auto* current = FindRecord(index, name);
        *current->mutable_changed_paths() = report.changed_paths();
        *current->mutable_last_activity_at() = util::ToProto(util::Now());
      },
      "validate-" + name);

  Audit("validate", name, "ok", std::to_string(report.changed_paths_size()) + " changed");
  return report;
}

coord::v1::ValidationReport WorkspaceManager::Inspect(const WorkspaceRecord& record) {
  coord::v1::ValidationReport report;
  report.set_workspace(record.name());

  const std::filesystem::path path(record.path());
  if (!std::filesystem::is_directory(path) || !IsRegisteredWorktree(path)) {
    throw util::ValidationFailed("workspace " + record.name() + " is not a registered worktree: " + path.string());
  }

  const auto head = vcs_->ResolveCommit(path, "HEAD");
  if (!vcs_->IsAncestor(record.base_point(), head)) {
    throw util::ValidationFailed("workspace " + record.name() + " no longer descends from its base point " + record.base_point());
  }

  if (options_.require_completion_marker && !std::filesystem::exists(path / options_.completion_marker)) {
    throw util::ValidationFailed("workspace " + record.name() + " has no completion marker " + options_.completion_marker);
  }

  const auto dirty = vcs_->DirtyPaths(path, {options_.completion_marker});
  SetPaths(report.mutable_dirty_paths(), dirty);
  if (!dirty.empty()) {
    throw util::DirtyState("workspace " + record.name() + " has uncommitted changes", dirty);
  }

  std::vector<std::string> violating;
  for (const auto& changed : vcs_->ChangedPaths(record.base_point(), head)) {
    if (changed == options_.completion_marker) continue;
    report.add_changed_paths(changed);
    if (!WithinScope(changed, record.scope())) violating.push_back(changed);
  }
  SetPaths(report.mutable_violating_paths(), violating);
  if (!violating.empty()) {
    throw util::IsolationViolation("workspace " + record.name() + " changed paths outside its scope", violating);
  }

  const auto trunk_dirty = vcs_->DirtyPaths(options_.repository, TrunkExclusions());
  if (!trunk_dirty.empty()) {
    throw util::IsolationViolation("trunk checkout has uncommitted changes", trunk_dirty);
  }

  report.set_ok(true);
  report.set_message(std::to_string(report.changed_paths_size()) + " changed paths");
  return report;
}

void WorkspaceManager::CheckDependencies(const WorkspaceRecord& record, const WorkspaceIndex& index) {
  for (const auto& dep : record.depends_on()) {
    auto it = index.workspaces().find(dep);
    if (it == index.workspaces().end()) {
      throw util::InvalidState("workspace " + record.name() + " depends on unknown workspace " + dep);
    }
    const auto status = it->second.status();
    if (status != coord::v1::WORKSPACE_STATUS_MERGED && status != coord::v1::WORKSPACE_STATUS_ARCHIVED) {
      throw util::InvalidState("workspace " + record.name() + " depends on " + dep + " which is " + std::string(ToString(status)));
    }
  }
}

void WorkspaceManager::CheckDisjoint(const WorkspaceRecord& record, const std::vector<std::string>& changed, const WorkspaceIndex& index) {
  const std::set<std::string> mine(changed.begin(), changed.end());
  std::set<std::string>       overlap;
  std::vector<std::string>    against;

  auto check = [&](const WorkspaceRecord& other) {
    if (other.name() == record.name() || other.merge_commit().empty()) return;
    if (other.status() != coord::v1::WORKSPACE_STATUS_MERGED && other.status() != coord::v1::WORKSPACE_STATUS_ARCHIVED) return;
    // Already part of this workspace's history: git handles it.
    if (vcs_->IsAncestor(other.merge_commit(), record.base_point())) return;

    bool hit = false;
    for (const auto& path : other.changed_paths()) {
      if (mine.count(path)) {
        overlap.insert(path);
        hit = true;
      }
    }
    if (hit) against.push_back(other.name());
  };

  for (const auto& [name, other] : index.workspaces()) check(other);
  for (const auto& other : index.history()) check(other);

  if (!overlap.empty()) {
    std::string names;
    for (const auto& name : against) names += (names.empty() ? "" : ", ") + name;
    throw util::MergeConflict("workspace " + record.name() + " overlaps merged workspaces: " + names, {overlap.begin(), overlap.end()});
  }
}

WorkspaceRecord WorkspaceManager::Merge(const std::string& name, std::optional<MergeStrategy> requested) {
  RequireFeature("workspace-merge");

  const auto started = util::Now();
  auto       trunk   = LockTrunk("merge " + name);

  WorkspaceRecord record;
  index_->Write(
      [&](WorkspaceIndex* index) {
        auto* current = FindRecord(index, name);
        if (current->status() == coord::v1::WORKSPACE_STATUS_CONFLICT) {
          throw util::InvalidState("workspace " + name + " has unresolved conflicts");
        }
        Transition(current, coord::v1::WORKSPACE_STATUS_VALIDATING);
        if (requested) current->set_strategy(*requested);
        if (current->strategy() == coord::v1::MERGE_STRATEGY_UNSPECIFIED) current->set_strategy(options_.default_strategy);
        record = *current;
      },
      "merge-begin-" + name);

  MergeOutcome outcome;
  try {
    auto report = Inspect(record);

    const auto                     index = index_->Read().document;
    const std::vector<std::string> changed(report.changed_paths().begin(), report.changed_paths().end());
    CheckDependencies(record, index);
    CheckDisjoint(record, changed, index);

    const auto checked_out = vcs_->CurrentBranch(options_.repository);
    if (checked_out != options_.trunk_branch) {
      throw util::InvalidState("trunk checkout is on '" + checked_out + "', expected " + options_.trunk_branch);
    }

    const auto message = "Merge workspace " + name + " (" + record.task_key() + ")";
    outcome            = vcs_->Merge(options_.repository, record.branch(), record.strategy(), message);
    if (!outcome.merged) {
      if (outcome.conflicts.empty()) {
        throw util::MergeConflict("workspace " + name + " cannot be fast-forwarded onto " + options_.trunk_branch, {});
      }
      throw util::MergeConflict("workspace " + name + " conflicts with " + options_.trunk_branch, outcome.conflicts);
    }

    index_->Write(
        [&](WorkspaceIndex* index) {
          auto* current = FindRecord(index, name);
          Transition(current, coord::v1::WORKSPACE_STATUS_MERGED);
          current->set_merge_status(coord::v1::MERGE_STATUS_MERGED);
          current->set_merge_commit(outcome.commit);
          *current->mutable_merged_at() = util::ToProto(util::Now());
          SetPaths(current->mutable_changed_paths(), changed);
          current->clear_conflict_paths();
          current->clear_resolved_paths();
          record = *current;
        },
        "merge-" + name);
  } catch (const util::MergeConflict& e) {
    SettleFailedMerge(name, e.Paths(), e.what());
    Audit("merge", name, "conflict", e.what());
    throw;
  } catch (const std::exception& e) {
    SettleFailedMerge(name, {}, e.what());
    Audit("merge", name, "failed", e.what());
    throw;
  }

  trunk.Release();

  state_->CompleteUnit(record.task_key(), "workspace_merged:" + name);

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - started).count();
  Audit("merge", name, "merged", outcome.commit);
  COORD_LOG_INFO("workspace merged", {observability::StringField("workspace", name), observability::StringField("commit", outcome.commit),
                                      observability::StringField("strategy", std::string(ToString(record.strategy()))),
                                      observability::IntField("duration_ms", elapsed)});
  return record;
}

void WorkspaceManager::SettleFailedMerge(const std::string& name, const std::vector<std::string>& conflicts, const std::string& reason) {
  try {
    index_->Write(
        [&](WorkspaceIndex* index) {
          auto* current = FindRecord(index, name);
          if (current->status() != coord::v1::WORKSPACE_STATUS_VALIDATING) return;
          if (conflicts.empty()) {
            Transition(current, coord::v1::WORKSPACE_STATUS_ACTIVE);
            return;
          }
          Transition(current, coord::v1::WORKSPACE_STATUS_CONFLICT);
          current->set_merge_status(coord::v1::MERGE_STATUS_CONFLICT);
          SetPaths(current->mutable_conflict_paths(), conflicts);
          current->clear_resolved_paths();
        },
        conflicts.empty() ? "merge-failed-" + name : "merge-conflict-" + name);
  } catch (const util::CoordError& e) {
    COORD_LOG_ERROR("could not settle workspace after failed merge; run repair",
                    {observability::StringField("workspace", name), observability::StringField("merge_error", reason),
                     observability::StringField("error", e.what())});
  }
}

WorkspaceRecord WorkspaceManager::AcceptOurs(const std::string& name, const std::string& path) {
  return Resolve(name, path, "ours", [&](const std::filesystem::path& checkout) { vcs_->TakeVersion(checkout, options_.trunk_branch, path); });
}

WorkspaceRecord WorkspaceManager::AcceptTheirs(const std::string& name, const std::string& path) {
  return Resolve(name, path, "theirs", [&](const std::filesystem::path& checkout) { vcs_->TakeVersion(checkout, "HEAD", path); });
}

WorkspaceRecord WorkspaceManager::ProvideResolved(const std::string& name, const std::string& path, const std::string& content) {
  return Resolve(name, path, "provided", [&](const std::filesystem::path& checkout) {
    const auto target = checkout / path;
    util::EnsureDirectory(target.parent_path());
    util::AtomicWriteFile(target, content, false);
    vcs_->Stage(checkout, path);
  });
}

WorkspaceRecord WorkspaceManager::Resolve(const std::string& name, const std::string& raw_path, const std::string& how, const Apply& apply) {
  const auto path = NormalizeRepoPath(raw_path, "conflict path");

  WorkspaceRecord record;
  bool            completed = false;
  index_->Write(
      [&](WorkspaceIndex* index) {
        auto* current = FindRecord(index, name);
        if (current->status() != coord::v1::WORKSPACE_STATUS_CONFLICT) {
          throw util::InvalidState("workspace " + name + " is " + std::string(ToString(current->status())) + ", not in conflict");
        }

        const std::filesystem::path checkout(current->path());
        if (!vcs_->MergeInProgress(checkout)) {
          const auto unmerged = vcs_->BeginMerge(checkout, options_.trunk_branch, "Merge " + options_.trunk_branch + " into workspace " + name);
          for (const auto& p : unmerged) {
            if (!Contains(current->conflict_paths(), p)) current->add_conflict_paths(p);
          }
        }
        if (!Contains(current->conflict_paths(), path)) {
          throw util::ValidationFailed("not a conflict path of workspace " + name + ": " + path);
        }

        apply(checkout);
        if (!Contains(current->resolved_paths(), path)) current->add_resolved_paths(path);
        *current->mutable_last_activity_at() = util::ToProto(util::Now());

        for (const auto& p : current->conflict_paths()) {
          if (!Contains(current->resolved_paths(), p)) {
            record = *current;
            return;
          }
        }
        if (!vcs_->UnmergedPaths(checkout).empty()) {
          record = *current;
          return;
        }

        if (vcs_->MergeInProgress(checkout)) {
          vcs_->Commit(checkout, "Merge " + options_.trunk_branch + " into workspace " + name);
          current->set_base_point(vcs_->ResolveCommit(checkout, "HEAD^2"));
        } else {
          current->set_base_point(vcs_->ResolveCommit(checkout, options_.trunk_branch));
        }
        Transition(current, coord::v1::WORKSPACE_STATUS_ACTIVE);
        current->set_merge_status(coord::v1::MERGE_STATUS_PENDING);
        current->clear_conflict_paths();
        current->clear_resolved_paths();
        completed = true;
        record    = *current;
      },
      "resolve-" + name);

  Audit("resolve", name, how, path);
  if (completed) {
    COORD_LOG_INFO("workspace conflicts resolved", {observability::StringField("workspace", name), observability::StringField("base", record.base_point())});
  }
  return record;
}

WorkspaceRecord WorkspaceManager::Abort(const std::string& name) {
  WorkspaceRecord record;
  index_->Write(
      [&](WorkspaceIndex* index) {
        auto* current = FindRecord(index, name);
        if (current->status() != coord::v1::WORKSPACE_STATUS_CONFLICT) {
          throw util::InvalidState("workspace " + name + " is not in conflict");
        }
        const std::filesystem::path checkout(current->path());
        if (std::filesystem::is_directory(checkout) && vcs_->MergeInProgress(checkout)) {
          vcs_->AbortMerge(checkout);
        }
        Transition(current, coord::v1::WORKSPACE_STATUS_ACTIVE);
        current->set_merge_status(coord::v1::MERGE_STATUS_PENDING);
        current->clear_conflict_paths();
        current->clear_resolved_paths();
        record = *current;
      },
      "abort-" + name);

  Audit("abort", name, "active");
  return record;
}

WorkspaceRecord WorkspaceManager::Cleanup(const std::string& name, bool archive, bool force) {
  if (archive) {
    RequireFeature("workspace-archive");
  }

  WorkspaceRecord record;
  index_->Write(
      [&](WorkspaceIndex* index) {
        auto* current = FindRecord(index, name);
        if (IsTerminal(current->status())) {
          throw util::InvalidState("workspace " + name + " is already " + std::string(ToString(current->status())));
        }
        const bool merged = current->status() == coord::v1::WORKSPACE_STATUS_MERGED;
        if (!merged && !force) {
          throw util::InvalidState("workspace " + name + " is " + std::string(ToString(current->status())) + "; cleanup requires force");
        }

        const bool branch_exists = vcs_->BranchExists(current->branch());
        if (archive) {
          const auto ref = branch_exists ? current->branch() : (current->merge_commit().empty() ? current->base_point() : current->merge_commit());
          const auto stem    = name + "-" + util::CompactUtc(util::Now());
          const auto tarball = options_.archive_dir / (stem + ".tar.gz");
          vcs_->Archive(ref, tarball);

          coord::v1::ArchiveManifest manifest;
          manifest.set_workspace(name);
          manifest.set_task_key(current->task_key());
          manifest.set_branch(current->branch());
          manifest.set_base_point(current->base_point());
          manifest.set_merge_commit(current->merge_commit());
          manifest.set_archive_file(tarball.string());
          for (auto& entry : vcs_->ListTree(ref)) *manifest.add_entries() = std::move(entry);
          *manifest.mutable_created_at() = util::ToProto(util::Now());
          util::AtomicWriteFile(options_.archive_dir / (stem + ".manifest.json"), util::ToJson(manifest), true);

          current->set_archive_path(tarball.string());
          *current->mutable_archived_at() = util::ToProto(util::Now());
        }

        const std::filesystem::path checkout(current->path());
        if (std::filesystem::exists(checkout)) {
          vcs_->RemoveWorktree(checkout, true);
        } else {
          vcs_->PruneWorktrees();
        }
        if (branch_exists) {
          vcs_->DeleteBranch(current->branch());
        }

        if (merged) {
          Transition(current, coord::v1::WORKSPACE_STATUS_ARCHIVED);
        } else {
          Transition(current, coord::v1::WORKSPACE_STATUS_FAILED);
          current->set_merge_status(coord::v1::MERGE_STATUS_ABORTED);
          current->set_failure_reason("cleaned up before merge");
          current->clear_conflict_paths();
          current->clear_resolved_paths();
        }
        record = *current;
      },
      "cleanup-" + name);

  Audit("cleanup", name, std::string(ToString(record.status())), record.archive_path());
  COORD_LOG_INFO("workspace cleaned up", {observability::StringField("workspace", name), observability::StringField("status", std::string(ToString(record.status()))),
                                          observability::BoolField("archived", archive)});
  return record;
}

coord::v1::RepairReport WorkspaceManager::Repair() {
  coord::v1::RepairReport report;

  {
    auto trunk = LockTrunk("repair");

    vcs_->PruneWorktrees();
    if (vcs_->MergeInProgress(options_.repository)) {
      vcs_->AbortMerge(options_.repository);
      report.set_trunk_merge_aborted(true);
      COORD_LOG_WARN("aborted unfinished trunk merge", {observability::StringField("repository", options_.repository.string())});
    }

    index_->Write(
        [&](WorkspaceIndex* index) {
          report.clear_removed_records();
          report.clear_archived_records();
          report.clear_reset_to_active();
          report.clear_marked_failed();
          report.clear_marked_merged();
          report.clear_orphaned_paths();

          const auto trunk_head = vcs_->ResolveCommit(options_.repository, options_.trunk_branch);
          const auto now        = util::ToProto(util::Now());

          std::set<std::string> registered;
          for (const auto& worktree : vcs_->ListWorktrees()) registered.insert(Canonical(worktree.path).string());

          std::vector<std::string> names;
          for (const auto& [name, record] : index->workspaces()) names.push_back(name);
          std::sort(names.begin(), names.end());

          std::set<std::string> referenced;
          for (const auto& name : names) {
            auto*      record  = &index->mutable_workspaces()->at(name);
            const auto path    = Canonical(record->path());
            const bool present = std::filesystem::is_directory(path) && registered.count(path.string()) > 0;

            if (record->status() == coord::v1::WORKSPACE_STATUS_VALIDATING) {
              std::string tip;
              if (vcs_->BranchExists(record->branch())) tip = vcs_->ResolveCommit(options_.repository, record->branch());
              if (!tip.empty() && tip != record->base_point() && vcs_->IsAncestor(tip, trunk_head)) {
                Transition(record, coord::v1::WORKSPACE_STATUS_MERGED);
                record->set_merge_status(coord::v1::MERGE_STATUS_MERGED);
                record->set_merge_commit(trunk_head);
                *record->mutable_merged_at() = now;
                report.add_marked_merged(name);
              } else if (present) {
                Transition(record, coord::v1::WORKSPACE_STATUS_ACTIVE);
                report.add_reset_to_active(name);
              } else {
                Transition(record, coord::v1::WORKSPACE_STATUS_FAILED);
                record->set_merge_status(coord::v1::MERGE_STATUS_ABORTED);
                record->set_failure_reason("merge interrupted and workspace missing");
                report.add_marked_failed(name);
              }
            }

            if (present) {
              if (IsLive(record->status())) referenced.insert(path.string());
              continue;
            }

            switch (record->status()) {
              case coord::v1::WORKSPACE_STATUS_MERGED:
                Transition(record, coord::v1::WORKSPACE_STATUS_ARCHIVED);
                *record->mutable_archived_at() = now;
                report.add_archived_records(name);
                break;
              case coord::v1::WORKSPACE_STATUS_ACTIVE:
              case coord::v1::WORKSPACE_STATUS_CONFLICT: {
                Transition(record, coord::v1::WORKSPACE_STATUS_FAILED);
                record->set_merge_status(coord::v1::MERGE_STATUS_ABORTED);
                record->set_failure_reason("workspace directory missing");
                record->clear_conflict_paths();
                record->clear_resolved_paths();
                *index->add_history() = *record;
                index->mutable_workspaces()->erase(name);
                report.add_removed_records(name);
                break;
              }
              default:
                break;
            }
          }

          if (std::filesystem::is_directory(options_.worktree_dir)) {
            for (const auto& entry : std::filesystem::directory_iterator(options_.worktree_dir)) {
              const auto path = Canonical(entry.path()).string();
              if (entry.is_directory() && !referenced.count(path)) report.add_orphaned_paths(path);
            }
          }
          const auto prefix = options_.worktree_dir.string() + "/";
          for (const auto& path : registered) {
            if (path.rfind(prefix, 0) == 0 && !referenced.count(path) && !Contains(report.orphaned_paths(), path)) {
              report.add_orphaned_paths(path);
            }
          }
        },
        "repair");
  }

  for (const auto& orphan : report.orphaned_paths()) {
    COORD_LOG_WARN("orphaned worktree", {observability::StringField("path", orphan)});
  }

  const auto index = index_->Read().document;
  const auto doc   = state_->Read().document;

  std::vector<std::pair<std::string, std::string>> missing; // task key, workspace
  auto collect = [&](const WorkspaceRecord& record) {
    if (record.status() != coord::v1::WORKSPACE_STATUS_MERGED && record.status() != coord::v1::WORKSPACE_STATUS_ARCHIVED) return;
    if (record.task_key().empty() || Contains(doc.completed_units(), record.task_key())) return;
    for (const auto& [key, name] : missing) {
      if (key == record.task_key()) return;
    }
    missing.emplace_back(record.task_key(), record.name());
  };
  for (const auto& [name, record] : index.workspaces()) collect(record);
  for (const auto& record : index.history()) collect(record);

  if (!missing.empty()) {
    state_->Write(
        [&](coord::v1::StateDocument* next) {
          for (const auto& [key, name] : missing) {
            if (!Contains(next->completed_units(), key)) next->add_completed_units(key);
            (*next->mutable_signals())["workspace_merged:" + name] = util::ToProto(util::Now());
          }
        },
        "workspace-repair");
    for (const auto& [key, name] : missing) report.add_units_restored(key);
  }

  Audit("repair", "*", "repaired",
        std::to_string(report.removed_records_size() + report.archived_records_size() + report.reset_to_active_size() + report.marked_failed_size() +
                       report.marked_merged_size()) +
            " records changed");
  return report;
}

bool WorkspaceManager::IsRegisteredWorktree(const std::filesystem::path& path) {
  const auto wanted = Canonical(path);
  for (const auto& worktree : vcs_->ListWorktrees()) {
    if (Canonical(worktree.path) == wanted) return true;
  }
  return false;
}

std::vector<std::string> WorkspaceManager::TrunkExclusions() const {
  std::vector<std::string> out;
  for (const auto& dir : {options_.coord_root, options_.worktree_dir, options_.archive_dir}) {
    const auto relative = dir.lexically_relative(options_.repository).generic_string();
    if (relative.empty() || relative == "." || relative.rfind("..", 0) == 0) continue;
    out.push_back(relative);
  }
  return out;
}

lock::ScopedLease WorkspaceManager::LockTrunk(const std::string& purpose) {
  return lock::ScopedLease(*locks_, locks_->Acquire(kTrunkLockResource, coord::v1::LOCK_MODE_EXCLUSIVE, options_.trunk_lock_timeout, {{"purpose", purpose}}));
}

void WorkspaceManager::RequireFeature(const std::string& feature) {
  if (recovery_) {
    recovery_->RequireFeature(feature);
  }
}

void WorkspaceManager::Audit(const std::string& action, const std::string& name, const std::string& outcome, const std::string& detail) {
  audit::AuditEvent event;
  event.timestamp  = util::Now();
  event.component  = "workspace";
  event.action     = action;
  event.resource   = name;
  event.holder_pid = util::CurrentPid();
  event.outcome    = outcome;
  event.detail     = detail;
  audit_->Record(event);
}

} // namespace coord::workspace
