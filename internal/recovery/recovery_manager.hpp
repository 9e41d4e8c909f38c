#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "checkpoint_store.hpp"
#include "coord/v1/report.pb.h"
#include "error_classifier.hpp"
#include "internal/audit/audit_trail.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/state/state_store.hpp"
#include "operation_state.hpp"

namespace coord::recovery {

struct RecoveryOptions {
  uint32_t                  max_attempts = 3;
  std::chrono::milliseconds base_delay{200};
  std::chrono::milliseconds max_delay{5000};
  uint32_t                  checkpoint_retention_count = 20;
  std::chrono::milliseconds checkpoint_retention_age{std::chrono::hours(24 * 7)};
};

struct OperationSpec {
  std::string name;

  // Non-critical operations that declare features degrade instead of failing once retries run out.
  bool                     critical = true;
  std::vector<std::string> features;

  std::optional<uint32_t>                  max_attempts;
  std::optional<std::chrono::milliseconds> base_delay;
};

struct OperationOutcome {
  OperationState               state    = OperationState::kAttempting;
  uint32_t                     attempts = 0;
  std::optional<util::ErrorKind> last_error;
  std::string                  last_message;
  std::vector<OperationState>  history;
};

/*
  RecoveryManager

  Runs operations under the recovery policy:

    Attempting → Succeeded
               → Failed → Retrying  → (Restoring) → Attempting
                        → Restoring → Attempting
                        → Degraded | Fatal

  Degraded mode lives in the state document so every process sees it.
*/
class RecoveryManager {
 public:
  using Operation   = std::function<void()>;
  using HealthProbe = std::function<bool()>;

  RecoveryManager(RecoveryOptions                     options,
                  std::shared_ptr<state::StateStore>  state,
                  std::shared_ptr<CheckpointStore>    checkpoints,
                  std::shared_ptr<lock::LockManager>  locks,
                  std::shared_ptr<audit::AuditTrail>  audit);

  coord::v1::Checkpoint Checkpoint(const std::string&              name,
                                   const std::string&              phase,
                                   const google::protobuf::Struct& payload,
                                   coord::v1::SnapshotKind         kind = coord::v1::SNAPSHOT_KIND_FULL_STATE);

  coord::v1::Checkpoint                Restore(const std::string& id);
  std::vector<coord::v1::Checkpoint>   ListCheckpoints();
  std::optional<coord::v1::Checkpoint> LatestCheckpoint(const std::string& name = {});
  std::vector<std::string>             PruneCheckpoints(std::optional<std::chrono::milliseconds> max_age = std::nullopt);

  util::ErrorKind ClassifyError(const std::exception& error) const;

  // Never throws for a degraded outcome; rethrows surfaced and fatal errors,
  // throws RetryExhausted when attempts run out.
  OperationOutcome Run(const OperationSpec& task, const Operation& op);

  void RetryWithBackoff(const std::string& name, const Operation& op, uint32_t max_attempts, std::chrono::milliseconds base_delay);

  void EnterDegradedMode(const std::string& reason, const std::vector<std::string>& features);
  void ExitDegradedMode();

  bool IsDegraded();
  bool IsFeatureEnabled(const std::string& feature);

  // Throws FeatureDisabled.
  void RequireFeature(const std::string& feature);

  void SetHealthProbe(HealthProbe probe);

  // Leaves degraded mode when the probe reports healthy. True when it did.
  bool TryAutoRecover();

  coord::v1::RecoveryStatus Status();

 private:
  void Advance(OperationOutcome* outcome, OperationState to, const std::string& name);

  // Latest checkpoint named after the operation, else (when allow_backup) the newest state backup.
  bool RestoreForRetry(const std::string& name, bool allow_backup);

  void Audit(const std::string& action, const std::string& resource, const std::string& outcome, const std::string& detail = {});

  RecoveryOptions                    options_;
  std::shared_ptr<state::StateStore> state_;
  std::shared_ptr<CheckpointStore>   checkpoints_;
  std::shared_ptr<lock::LockManager> locks_;
  std::shared_ptr<audit::AuditTrail> audit_;

  std::mutex  probe_mutex_;
  HealthProbe probe_;
};

} // namespace coord::recovery
