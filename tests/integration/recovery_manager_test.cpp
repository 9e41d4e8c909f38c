#include "internal/recovery/recovery_manager.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/audit/memory_audit_trail.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
using coord::recovery::OperationSpec;
using coord::recovery::OperationState;
using coord::recovery::RecoveryManager;
using coord::recovery::RecoveryOptions;
using namespace std::chrono_literals;

struct Fixture {
  fs::path                                         root;
  std::shared_ptr<coord::audit::MemoryAuditTrail> audit = std::make_shared<coord::audit::MemoryAuditTrail>();
  std::shared_ptr<coord::lock::LockManager>        locks;
  std::shared_ptr<coord::state::StateStore>        state;
  std::shared_ptr<coord::recovery::CheckpointStore> checkpoints;
  std::shared_ptr<RecoveryManager>                 recovery;

  explicit Fixture(const std::string& name, RecoveryOptions options = Defaults())
      : root(fs::temp_directory_path() / "coord_recovery_manager_tests" / name) {
    fs::remove_all(root);
    fs::create_directories(root);

    coord::lock::LockOptions lock_options;
    lock_options.lock_dir        = root / "locks";
    lock_options.default_timeout = 5s;
    lock_options.initial_backoff = 2ms;
    lock_options.priorities      = {{"trunk", 5}, {"state", 10}, {"workspace-index", 20}};
    locks                        = std::make_shared<coord::lock::LockManager>(lock_options, audit);

    coord::state::DocumentStoreOptions state_options;
    state_options.name          = coord::state::StateStore::kLockResource;
    state_options.file          = root / "state.json";
    state_options.backup_dir    = root / "backups";
    state_options.backup_prefix = "state";
    state_options.fsync         = false;

    auto schema = std::make_shared<const coord::state::StateSchema>("1.0", std::vector<std::string>{"pre-init", "phase0", "phase1", "complete"}, "pre-init");
    state       = std::make_shared<coord::state::StateStore>(state_options, schema, locks, audit);
    state->Init();

    checkpoints = std::make_shared<coord::recovery::CheckpointStore>(root / "checkpoints", state, audit);
    recovery    = std::make_shared<RecoveryManager>(options, state, checkpoints, locks, audit);
  }

  static RecoveryOptions Defaults() {
    RecoveryOptions options;
    options.max_attempts = 3;
    options.base_delay   = 1ms;
    options.max_delay    = 4ms;
    return options;
  }
};

google::protobuf::Struct Payload(const std::string& key, const std::string& value) {
  google::protobuf::Struct payload;
  (*payload.mutable_fields())[key].set_string_value(value);
  return payload;
}

bool Contains(const std::vector<OperationState>& history, OperationState state) {
  return std::find(history.begin(), history.end(), state) != history.end();
}

void TestFullStateCheckpointRestoresAsNewVersion() {
  Fixture f("full");
  f.state->SetPhase("phase0", "");

  const auto checkpoint = f.recovery->Checkpoint("phase0-done", "", Payload("task", "phase0-task1"));
  assert(checkpoint.phase_at_capture() == "phase0");
  assert(checkpoint.state_snapshot().version() == 2);
  assert(checkpoint.payload().fields().at("task").string_value() == "phase0-task1");

  f.state->SetPhase("phase1", "");
  f.state->CompleteUnit("phase1-task1", "");

  const auto restored = f.recovery->Restore(checkpoint.id());
  assert(restored.id() == checkpoint.id());

  const auto doc = f.state->Read().document;
  assert(doc.phase() == "phase0");
  assert(doc.completed_units_size() == 0);
  assert(doc.version() == 5);
  assert(doc.last_change_label() == "checkpoint-restore");

  bool missing = false;
  try {
    f.recovery->Restore("checkpoint-does-not-exist");
  } catch (const coord::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestPayloadCheckpointLeavesStateAlone() {
  Fixture f("payload");
  f.state->SetPhase("phase0", "");

  const auto checkpoint = f.recovery->Checkpoint("progress", "phase0", Payload("cursor", "42"), coord::v1::SNAPSHOT_KIND_PAYLOAD_ONLY);
  assert(!checkpoint.has_state_snapshot());

  f.state->SetPhase("phase1", "");
  f.recovery->Restore(checkpoint.id());
  assert(f.state->Read().document.phase() == "phase1");
}

void TestCheckpointsAreListedNewestLastAndShared() {
  Fixture f("listing");

  const auto a = f.recovery->Checkpoint("same", "", {});
  const auto b = f.recovery->Checkpoint("same", "", {});
  const auto c = f.recovery->Checkpoint("other", "", {});
  assert(a.id() != b.id());

  const auto all = f.recovery->ListCheckpoints();
  assert(all.size() == 3);
  assert(all.back().id() == c.id());
  assert(f.recovery->LatestCheckpoint("same")->id() == b.id());
  assert(!f.recovery->LatestCheckpoint("never").has_value());

  // A second store over the same directory sees checkpoints written by the first.
  coord::recovery::CheckpointStore other(f.root / "checkpoints", f.state, nullptr);
  assert(other.List().size() == 3);
  assert(other.Get(a.id()).name() == "same");

  assert(f.recovery->Status().checkpoint_count() == 3);
  assert(f.recovery->Status().latest_checkpoint() == c.id());
}

void TestCheckpointRetention() {
  auto options                       = Fixture::Defaults();
  options.checkpoint_retention_count = 2;
  Fixture f("retention", options);

  for (int i = 0; i < 4; ++i) {
    f.recovery->Checkpoint("step-" + std::to_string(i), "", {});
  }
  const auto kept = f.recovery->ListCheckpoints();
  assert(kept.size() == 2);
  assert(kept.back().name() == "step-3");

  const auto removed = f.recovery->PruneCheckpoints(0ms);
  assert(removed.size() == 2);
  assert(f.recovery->ListCheckpoints().empty());
}

void TestTransientFailuresAreRetried() {
  Fixture f("transient");

  int  calls = 0;
  auto outcome = f.recovery->Run({"flaky"}, [&] {
    if (++calls < 3) throw coord::util::Timeout("slow disk");
  });

  assert(outcome.state == OperationState::kSucceeded);
  assert(outcome.attempts == 3);
  assert(Contains(outcome.history, OperationState::kRetrying));
  assert(outcome.last_error == coord::util::ErrorKind::kTimeout);
}

void TestHumanDecisionsAreSurfacedImmediately() {
  Fixture f("surface");

  int  calls    = 0;
  bool surfaced = false;
  try {
    f.recovery->Run({"merge"}, [&] {
      ++calls;
      throw coord::util::MergeConflict("conflict", {"src/a.cpp"});
    });
  } catch (const coord::util::MergeConflict& e) {
    surfaced = e.Paths().size() == 1;
  }
  assert(surfaced);
  assert(calls == 1);

  bool escalated = false;
  try {
    f.recovery->Run({"write"}, [] { throw coord::util::PermissionDenied("read-only"); });
  } catch (const coord::util::PermissionDenied&) {
    escalated = true;
  }
  assert(escalated);
}

void TestCriticalOperationExhaustsRetries() {
  Fixture f("exhausted");

  int  calls = 0;
  bool threw = false;
  try {
    f.recovery->RetryWithBackoff("sync", [&] {
      ++calls;
      throw coord::util::ResourceExhausted("too many open files");
    }, 4, 1ms);
  } catch (const coord::util::RetryExhausted& e) {
    threw = e.Attempts() == 4 && e.LastKind() == coord::util::ErrorKind::kResourceExhausted;
  }
  assert(threw);
  assert(calls == 4);
  assert(!f.recovery->IsDegraded());
}

void TestNonCriticalOperationDegrades() {
  Fixture f("degraded");

  OperationSpec task;
  task.name     = "archive";
  task.critical = false;
  task.features = {"workspace-archive"};

  const auto outcome = f.recovery->Run(task, [] { throw coord::util::Timeout("archive stalled"); });
  assert(outcome.state == OperationState::kDegraded);
  assert(outcome.attempts == 3);

  assert(f.recovery->IsDegraded());
  assert(!f.recovery->IsFeatureEnabled("workspace-archive"));
  assert(f.recovery->IsFeatureEnabled("workspace-merge"));
  f.recovery->RequireFeature("workspace-merge");

  bool disabled = false;
  try {
    f.recovery->RequireFeature("workspace-archive");
  } catch (const coord::util::FeatureDisabled&) {
    disabled = true;
  }
  assert(disabled);

  const auto mode = f.state->Read().document.degraded_mode();
  assert(mode.enabled());
  assert(mode.reason().find("archive") != std::string::npos);

  assert(!f.recovery->TryAutoRecover());
  f.recovery->SetHealthProbe([] { return false; });
  assert(!f.recovery->TryAutoRecover());
  f.recovery->SetHealthProbe([] { return true; });
  assert(f.recovery->TryAutoRecover());
  assert(!f.recovery->IsDegraded());
  assert(f.recovery->IsFeatureEnabled("workspace-archive"));
}

void TestIntegrityFailureRestoresCheckpointBeforeRetry() {
  Fixture f("integrity");
  f.state->SetPhase("phase0", "");
  f.recovery->Checkpoint("advance", "", {});
  f.state->SetPhase("phase1", "");

  std::vector<std::string> seen;
  const auto               outcome = f.recovery->Run({"advance"}, [&] {
    const auto phase = f.state->Read().document.phase();
    seen.push_back(phase);
    if (phase == "phase1") throw coord::util::StateCorruption("half-applied phase");
  });

  assert(outcome.state == OperationState::kSucceeded);
  assert(Contains(outcome.history, OperationState::kRestoring));
  assert(seen.size() == 2);
  assert(seen[1] == "phase0");
}

void TestExplicitDegradedMode() {
  Fixture f("explicit");

  bool rejected = false;
  try {
    f.recovery->EnterDegradedMode("", {"workspace-merge"});
  } catch (const coord::util::ValidationFailed&) {
    rejected = true;
  }
  assert(rejected);

  f.recovery->EnterDegradedMode("git unavailable", {"workspace-merge"});
  f.recovery->EnterDegradedMode("git still unavailable", {"workspace-create", "workspace-merge"});
  auto mode = f.recovery->Status().degraded_mode();
  assert(mode.disabled_features_size() == 2);
  assert(mode.reason() == "git still unavailable");

  f.recovery->ExitDegradedMode();
  mode = f.recovery->Status().degraded_mode();
  assert(!mode.enabled());
  assert(mode.disabled_features_size() == 0);
}

} // namespace

int main() {
  TestFullStateCheckpointRestoresAsNewVersion();
  TestPayloadCheckpointLeavesStateAlone();
  TestCheckpointsAreListedNewestLastAndShared();
  TestCheckpointRetention();
  TestTransientFailuresAreRetried();
  TestHumanDecisionsAreSurfacedImmediately();
  TestCriticalOperationExhaustsRetries();
  TestNonCriticalOperationDegrades();
  TestIntegrityFailureRestoresCheckpointBeforeRetry();
  TestExplicitDegradedMode();

  std::cout << "coord_integration_recovery_manager: pass\n";
  return 0;
}
