#include "internal/workspace/workspace_manager.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/audit/memory_audit_trail.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/process.hpp"
#include "internal/workspace/git_backend.hpp"

namespace {

namespace fs = std::filesystem;
using coord::v1::WorkspaceRecord;
using coord::workspace::WorkspaceManager;
using namespace std::chrono_literals;

std::string Trim(std::string value) {
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) value.pop_back();
  return value;
}

std::string Git(const fs::path& dir, std::vector<std::string> args) {
  args.insert(args.begin(), {"git", "-C", dir.string()});
  const auto result = coord::util::RunCommand(args);
  if (!result.Ok()) {
    std::cerr << "git failed: " << result.err << "\n";
  }
  assert(result.Ok());
  return Trim(result.out);
}

void WriteFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  coord::util::AtomicWriteFile(path, content, false);
}

std::string CommitFile(const fs::path& checkout, const std::string& path, const std::string& content) {
  WriteFile(checkout / path, content);
  Git(checkout, {"add", "-A"});
  Git(checkout, {"commit", "-q", "-m", "edit " + path});
  return Git(checkout, {"rev-parse", "HEAD"});
}

struct Fixture {
  fs::path base;
  fs::path repo;

  std::shared_ptr<coord::audit::MemoryAuditTrail>    audit = std::make_shared<coord::audit::MemoryAuditTrail>();
  std::shared_ptr<coord::lock::LockManager>           locks;
  std::shared_ptr<coord::state::StateStore>           state;
  std::shared_ptr<coord::recovery::CheckpointStore>   checkpoints;
  std::shared_ptr<coord::recovery::RecoveryManager>   recovery;
  std::shared_ptr<coord::workspace::WorkspaceIndexStore> index;
  std::shared_ptr<WorkspaceManager>                   workspaces;

  explicit Fixture(const std::string& name) : base(fs::temp_directory_path() / "coord_workspace_manager_tests" / name), repo(base / "repo") {
    fs::remove_all(base);
    fs::create_directories(repo);

    Git(repo, {"init", "-q"});
    Git(repo, {"symbolic-ref", "HEAD", "refs/heads/main"});
    Git(repo, {"config", "user.email", "ci@example.com"});
    Git(repo, {"config", "user.name", "CI"});
    CommitFile(repo, "README.md", "trunk\n");
    CommitFile(repo, "shared.txt", "original\n");

    const auto coord_root = base / "coord";

    coord::lock::LockOptions lock_options;
    lock_options.lock_dir        = coord_root / "locks";
    lock_options.default_timeout = 10s;
    lock_options.initial_backoff = 2ms;
    lock_options.priorities      = {{"trunk", 5}, {"state", 10}, {"workspace-index", 20}};
    locks                        = std::make_shared<coord::lock::LockManager>(lock_options, audit);

    coord::state::DocumentStoreOptions state_options;
    state_options.name          = coord::state::StateStore::kLockResource;
    state_options.file          = coord_root / "state.json";
    state_options.backup_dir    = coord_root / "backups";
    state_options.backup_prefix = "state";
    state_options.fsync         = false;

    auto schema = std::make_shared<const coord::state::StateSchema>("1.0", std::vector<std::string>{"pre-init", "phase0", "phase1", "complete"}, "pre-init");
    state       = std::make_shared<coord::state::StateStore>(state_options, schema, locks, audit);
    state->Init();

    checkpoints = std::make_shared<coord::recovery::CheckpointStore>(coord_root / "checkpoints", state, audit);
    recovery    = std::make_shared<coord::recovery::RecoveryManager>(coord::recovery::RecoveryOptions{}, state, checkpoints, locks, audit);

    auto index_options          = state_options;
    index_options.file          = coord_root / "workspaces.json";
    index_options.backup_dir    = coord_root / "backups";
    index_options.backup_prefix = "index";
    index                       = coord::workspace::MakeIndexStore(index_options, locks, audit);
    index->Init();

    coord::workspace::GitOptions git;
    git.repository   = repo;
    git.commit_name  = "coord";
    git.commit_email = "coord@localhost";

    coord::workspace::WorkspaceOptions options;
    options.repository   = repo;
    options.worktree_dir = base / "worktrees";
    options.archive_dir  = base / "archive";
    options.coord_root   = coord_root;
    options.trunk_branch = "main";

    workspaces = std::make_shared<WorkspaceManager>(options, std::make_shared<coord::workspace::GitCliBackend>(git), index, state, locks, recovery, audit);
  }

  std::string TrunkHead() const {
    return Git(repo, {"rev-parse", "main"});
  }

  std::string TrunkFile(const std::string& path) const {
    return coord::util::ReadFile(repo / path);
  }
};

template <typename Error>
bool Throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

bool Contains(const google::protobuf::RepeatedPtrField<std::string>& list, const std::string& value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

void TestCreateIsolatesTaskFromTrunk() {
  Fixture f("create");
  const auto trunk = f.TrunkHead();

  const auto record = f.workspaces->Create("phase1-task1");
  assert(record.name() == "phase1-task1");
  assert(record.status() == coord::v1::WORKSPACE_STATUS_ACTIVE);
  assert(record.branch() == "workspace/phase1-task1");
  assert(record.base_point() == trunk);
  assert(fs::is_directory(record.path()));
  assert(Git(record.path(), {"rev-parse", "--abbrev-ref", "HEAD"}) == "workspace/phase1-task1");

  // Work in the worktree does not reach trunk.
  CommitFile(record.path(), "src/feature.txt", "feature\n");
  assert(f.TrunkHead() == trunk);
  assert(!fs::exists(f.repo / "src/feature.txt"));

  assert(Throws<coord::util::AlreadyExists>([&] { f.workspaces->Create("phase1-task1"); }));
  assert(Throws<coord::util::WorkspaceNotFound>([&] { f.workspaces->Get("phase9-task9"); }));
  assert(Throws<coord::util::NotFound>([&] { f.workspaces->Create("phase1-task2", "no-such-ref"); }));
  assert(!fs::exists(f.base / "worktrees" / "phase1-task2"));

  assert(f.workspaces->List().size() == 1);
  assert(f.workspaces->Get("phase1-task1").task_key() == "phase1-task1");
}

void TestFastForwardMergeThenArchive() {
  Fixture f("fast-forward");

  const auto created = f.workspaces->Create("phase1-task1");
  const auto tip     = CommitFile(created.path(), "src/feature.txt", "feature\n");

  const auto report = f.workspaces->Validate("phase1-task1");
  assert(report.ok());
  assert(report.changed_paths_size() == 1);
  assert(report.changed_paths(0) == "src/feature.txt");

  const auto merged = f.workspaces->Merge("phase1-task1", coord::v1::MERGE_STRATEGY_FAST_FORWARD);
  assert(merged.status() == coord::v1::WORKSPACE_STATUS_MERGED);
  assert(merged.merge_commit() == tip);
  assert(f.TrunkHead() == tip);
  assert(f.TrunkFile("src/feature.txt") == "feature\n");

  const auto doc = f.state->Read().document;
  assert(Contains(doc.completed_units(), "phase1-task1"));
  assert(doc.signals().count("workspace_merged:phase1-task1") == 1);

  const auto archived = f.workspaces->Cleanup("phase1-task1", true, false);
  assert(archived.status() == coord::v1::WORKSPACE_STATUS_ARCHIVED);
  assert(fs::exists(archived.archive_path()));
  assert(!fs::exists(created.path()));
  assert(Git(f.repo, {"branch", "--list", "workspace/phase1-task1"}).empty());

  bool manifest = false;
  for (const auto& entry : fs::directory_iterator(f.base / "archive")) {
    if (entry.path().string().find(".manifest.json") != std::string::npos) manifest = true;
  }
  assert(manifest);

  assert(Throws<coord::util::InvalidState>([&] { f.workspaces->Cleanup("phase1-task1", false, true); }));
}

void TestDisjointWorkspacesMergeIndependently() {
  Fixture f("disjoint");

  const auto a = f.workspaces->Create("phase2-task1");
  const auto b = f.workspaces->Create("phase2-task2");
  CommitFile(a.path(), "a.txt", "from a\n");
  CommitFile(b.path(), "b.txt", "from b\n");

  f.workspaces->Merge("phase2-task1");
  const auto second = f.workspaces->Merge("phase2-task2");
  assert(second.status() == coord::v1::WORKSPACE_STATUS_MERGED);

  assert(f.TrunkFile("a.txt") == "from a\n");
  assert(f.TrunkFile("b.txt") == "from b\n");
  assert(Git(f.repo, {"status", "--porcelain"}).empty());

  const auto units = f.state->Read().document.completed_units();
  assert(units.size() == 2);
}

void TestOverlappingWorkspaceConflictsAndResolves() {
  Fixture f("overlap");

  const auto first  = f.workspaces->Create("phase3-task1");
  const auto second = f.workspaces->Create("phase3-task2");
  CommitFile(first.path(), "shared.txt", "first\n");
  CommitFile(second.path(), "shared.txt", "second\n");

  f.workspaces->Merge("phase3-task1");
  const auto trunk = f.TrunkHead();

  bool conflicted = false;
  try {
    f.workspaces->Merge("phase3-task2");
  } catch (const coord::util::MergeConflict& e) {
    conflicted = std::find(e.Paths().begin(), e.Paths().end(), "shared.txt") != e.Paths().end();
  }
  assert(conflicted);
  assert(f.TrunkHead() == trunk);
  assert(f.TrunkFile("shared.txt") == "first\n");

  auto record = f.workspaces->Get("phase3-task2");
  assert(record.status() == coord::v1::WORKSPACE_STATUS_CONFLICT);
  assert(Contains(record.conflict_paths(), "shared.txt"));
  assert(Throws<coord::util::InvalidState>([&] { f.workspaces->Merge("phase3-task2"); }));
  assert(Throws<coord::util::ValidationFailed>([&] { f.workspaces->AcceptTheirs("phase3-task2", "README.md"); }));

  record = f.workspaces->AcceptTheirs("phase3-task2", "shared.txt");
  assert(record.status() == coord::v1::WORKSPACE_STATUS_ACTIVE);
  assert(record.base_point() == trunk);

  const auto merged = f.workspaces->Merge("phase3-task2");
  assert(merged.status() == coord::v1::WORKSPACE_STATUS_MERGED);
  assert(f.TrunkFile("shared.txt") == "second\n");
}

void TestProvidedResolutionAndAbort() {
  Fixture f("provided");

  const auto first  = f.workspaces->Create("phase4-task1");
  const auto second = f.workspaces->Create("phase4-task2");
  CommitFile(first.path(), "shared.txt", "first\n");
  CommitFile(second.path(), "shared.txt", "second\n");
  f.workspaces->Merge("phase4-task1");

  assert(Throws<coord::util::MergeConflict>([&] { f.workspaces->Merge("phase4-task2"); }));

  // Abort drops the resolution attempt and returns the workspace to active.
  const auto aborted = f.workspaces->Abort("phase4-task2");
  assert(aborted.status() == coord::v1::WORKSPACE_STATUS_ACTIVE);
  assert(aborted.conflict_paths_size() == 0);
  assert(Throws<coord::util::InvalidState>([&] { f.workspaces->Abort("phase4-task2"); }));

  assert(Throws<coord::util::MergeConflict>([&] { f.workspaces->Merge("phase4-task2"); }));
  const auto resolved = f.workspaces->ProvideResolved("phase4-task2", "shared.txt", "first\nsecond\n");
  assert(resolved.status() == coord::v1::WORKSPACE_STATUS_ACTIVE);

  f.workspaces->Merge("phase4-task2");
  assert(f.TrunkFile("shared.txt") == "first\nsecond\n");
}

void TestThreeWayConflictLeavesTrunkUntouched() {
  Fixture f("three-way");

  const auto ws = f.workspaces->Create("phase5-task1");
  CommitFile(ws.path(), "shared.txt", "workspace\n");

  // Trunk moves on underneath the workspace.
  CommitFile(f.repo, "shared.txt", "trunk\n");
  const auto trunk = f.TrunkHead();

  assert(Throws<coord::util::MergeConflict>([&] { f.workspaces->Merge("phase5-task1", coord::v1::MERGE_STRATEGY_THREE_WAY); }));
  assert(f.TrunkHead() == trunk);
  assert(f.TrunkFile("shared.txt") == "trunk\n");
  assert(Git(f.repo, {"status", "--porcelain"}).empty());

  const auto record = f.workspaces->Get("phase5-task1");
  assert(record.status() == coord::v1::WORKSPACE_STATUS_CONFLICT);

  f.workspaces->AcceptOurs("phase5-task1", "shared.txt");
  f.workspaces->Merge("phase5-task1");
  assert(f.TrunkFile("shared.txt") == "trunk\n");
}

void TestFastForwardRefusedWhenTrunkMoved() {
  Fixture f("ff-refused");

  const auto ws = f.workspaces->Create("phase6-task1");
  CommitFile(ws.path(), "feature.txt", "feature\n");
  CommitFile(f.repo, "other.txt", "other\n");
  const auto trunk = f.TrunkHead();

  assert(Throws<coord::util::MergeConflict>([&] { f.workspaces->Merge("phase6-task1", coord::v1::MERGE_STRATEGY_FAST_FORWARD); }));
  assert(f.TrunkHead() == trunk);
  assert(f.workspaces->Get("phase6-task1").status() == coord::v1::WORKSPACE_STATUS_ACTIVE);

  const auto squashed = f.workspaces->Merge("phase6-task1", coord::v1::MERGE_STRATEGY_SQUASH);
  assert(squashed.status() == coord::v1::WORKSPACE_STATUS_MERGED);
  assert(f.TrunkFile("feature.txt") == "feature\n");
  assert(Git(f.repo, {"rev-parse", "main^"}) == trunk);
}

void TestValidationGuardsMerges() {
  Fixture f("validation");

  coord::workspace::CreateOptions scoped;
  scoped.scope = {"src"};
  const auto ws = f.workspaces->Create("phase7-task1", "", scoped);
  CommitFile(ws.path(), "src/ok.txt", "ok\n");
  CommitFile(ws.path(), "docs/outside.md", "nope\n");

  bool violated = false;
  try {
    f.workspaces->Validate("phase7-task1");
  } catch (const coord::util::IsolationViolation& e) {
    violated = e.Paths().size() == 1 && e.Paths()[0] == "docs/outside.md";
  }
  assert(violated);

  const auto trunk = f.TrunkHead();
  assert(Throws<coord::util::IsolationViolation>([&] { f.workspaces->Merge("phase7-task1"); }));
  assert(f.TrunkHead() == trunk);
  assert(f.workspaces->Get("phase7-task1").status() == coord::v1::WORKSPACE_STATUS_ACTIVE);

  const auto other = f.workspaces->Create("phase7-task2");
  WriteFile(fs::path(other.path()) / "scratch.txt", "uncommitted\n");
  bool dirty = false;
  try {
    f.workspaces->Validate("phase7-task2");
  } catch (const coord::util::DirtyState& e) {
    dirty = e.Paths().size() == 1 && e.Paths()[0] == "scratch.txt";
  }
  assert(dirty);
}

void TestDependenciesMergeFirst() {
  Fixture f("dependencies");

  f.workspaces->Create("phase8-task1");
  coord::workspace::CreateOptions after;
  after.depends_on = {"phase8-task1"};
  const auto dependent = f.workspaces->Create("phase8-task2", "", after);
  CommitFile(dependent.path(), "later.txt", "later\n");

  assert(Throws<coord::util::InvalidState>([&] { f.workspaces->Merge("phase8-task2"); }));
  assert(f.workspaces->Get("phase8-task2").status() == coord::v1::WORKSPACE_STATUS_ACTIVE);

  CommitFile(f.workspaces->Get("phase8-task1").path(), "first.txt", "first\n");
  f.workspaces->Merge("phase8-task1");
  f.workspaces->Merge("phase8-task2");
  assert(f.TrunkFile("later.txt") == "later\n");
}

void TestForcedCleanupAndRecreate() {
  Fixture f("forced");

  const auto ws = f.workspaces->Create("phase9-task1");
  assert(Throws<coord::util::InvalidState>([&] { f.workspaces->Cleanup("phase9-task1", false, false); }));

  const auto failed = f.workspaces->Cleanup("phase9-task1", false, true);
  assert(failed.status() == coord::v1::WORKSPACE_STATUS_FAILED);
  assert(!fs::exists(ws.path()));

  const auto again = f.workspaces->Create("phase9-task1");
  assert(again.status() == coord::v1::WORKSPACE_STATUS_ACTIVE);

  coord::workspace::ListFilter history;
  history.include_history = true;
  assert(f.workspaces->List(history).size() == 2);

  coord::workspace::ListFilter failed_only;
  failed_only.status          = coord::v1::WORKSPACE_STATUS_FAILED;
  failed_only.include_history = true;
  assert(f.workspaces->List(failed_only).size() == 1);
}

void TestRepairReconcilesIndexWithDisk() {
  Fixture f("repair");

  const auto lost = f.workspaces->Create("phase10-task1");
  fs::remove_all(lost.path());

  const auto merged = f.workspaces->Create("phase10-task2");
  CommitFile(merged.path(), "done.txt", "done\n");
  f.workspaces->Merge("phase10-task2");

  // Simulate a crash between the merge and the state update.
  f.state->Write(
      [](coord::v1::StateDocument* doc) {
        doc->clear_completed_units();
        doc->clear_signals();
      },
      "simulate-crash");

  fs::create_directories(f.base / "worktrees" / "stray");

  const auto report = f.workspaces->Repair();
  assert(Contains(report.removed_records(), "phase10-task1"));
  assert(Contains(report.units_restored(), "phase10-task2"));
  assert(report.orphaned_paths_size() == 1);
  assert(report.orphaned_paths(0).find("stray") != std::string::npos);
  assert(!report.trunk_merge_aborted());

  assert(Throws<coord::util::WorkspaceNotFound>([&] { f.workspaces->Get("phase10-task1"); }));
  assert(Contains(f.state->Read().document.completed_units(), "phase10-task2"));

  // A second pass finds nothing left to do.
  const auto clean = f.workspaces->Repair();
  assert(clean.removed_records_size() == 0);
  assert(clean.units_restored_size() == 0);
}

void TestDegradedModeBlocksMerges() {
  Fixture f("degraded");

  f.workspaces->Create("phase11-task1");
  f.recovery->EnterDegradedMode("trunk unstable", {"workspace-merge"});

  assert(Throws<coord::util::FeatureDisabled>([&] { f.workspaces->Merge("phase11-task1"); }));
  assert(f.workspaces->Get("phase11-task1").status() == coord::v1::WORKSPACE_STATUS_ACTIVE);

  f.recovery->ExitDegradedMode();
  f.workspaces->Merge("phase11-task1");
}

} // namespace

int main() {
  TestCreateIsolatesTaskFromTrunk();
  TestFastForwardMergeThenArchive();
  TestDisjointWorkspacesMergeIndependently();
  TestOverlappingWorkspaceConflictsAndResolves();
  TestProvidedResolutionAndAbort();
  TestThreeWayConflictLeavesTrunkUntouched();
  TestFastForwardRefusedWhenTrunkMoved();
  TestValidationGuardsMerges();
  TestDependenciesMergeFirst();
  TestForcedCleanupAndRecreate();
  TestRepairReconcilesIndexWithDisk();
  TestDegradedModeBlocksMerges();

  std::cout << "coord_integration_workspace_manager: pass\n";
  return 0;
}
