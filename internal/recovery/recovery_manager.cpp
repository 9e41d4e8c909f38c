#include "recovery_manager.hpp"

#include <algorithm>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"
#include "internal/util/time.hpp"

namespace coord::recovery {

using util::ErrorKind;

RecoveryManager::RecoveryManager(RecoveryOptions                    options,
                                 std::shared_ptr<state::StateStore> state,
                                 std::shared_ptr<CheckpointStore>   checkpoints,
                                 std::shared_ptr<lock::LockManager> locks,
                                 std::shared_ptr<audit::AuditTrail> audit)
    : options_(std::move(options)),
      state_(std::move(state)),
      checkpoints_(std::move(checkpoints)),
      locks_(std::move(locks)),
      audit_(audit ? std::move(audit) : std::make_shared<audit::NullAuditTrail>()) {
}

coord::v1::Checkpoint RecoveryManager::Checkpoint(const std::string& name, const std::string& phase, const google::protobuf::Struct& payload,
                                                  coord::v1::SnapshotKind kind) {
  auto checkpoint = checkpoints_->Create(name, phase, payload, kind);
  checkpoints_->Prune(options_.checkpoint_retention_count, options_.checkpoint_retention_age);
  return checkpoint;
}

coord::v1::Checkpoint RecoveryManager::Restore(const std::string& id) {
  return checkpoints_->Restore(id);
}

std::vector<coord::v1::Checkpoint> RecoveryManager::ListCheckpoints() {
  return checkpoints_->List();
}

std::optional<coord::v1::Checkpoint> RecoveryManager::LatestCheckpoint(const std::string& name) {
  return checkpoints_->Latest(name);
}

std::vector<std::string> RecoveryManager::PruneCheckpoints(std::optional<std::chrono::milliseconds> max_age) {
  return checkpoints_->Prune(options_.checkpoint_retention_count, max_age.value_or(options_.checkpoint_retention_age));
}

ErrorKind RecoveryManager::ClassifyError(const std::exception& error) const {
  return recovery::ClassifyError(error);
}

void RecoveryManager::Advance(OperationOutcome* outcome, OperationState to, const std::string& name) {
  if (!CanTransition(outcome->state, to)) {
    throw util::InvalidState("operation '" + name + "': illegal transition " + std::string(ToString(outcome->state)) + " -> " +
                             std::string(ToString(to)));
  }
  outcome->state = to;
  outcome->history.push_back(to);
}

bool RecoveryManager::RestoreForRetry(const std::string& name, bool allow_backup) {
  if (auto checkpoint = checkpoints_->Latest(name)) {
    checkpoints_->Restore(checkpoint->id());
    COORD_LOG_INFO("restored checkpoint before retry", {observability::StringField("operation", name), observability::StringField("checkpoint", checkpoint->id())});
    return true;
  }
  if (!allow_backup) {
    return false;
  }
  try {
    state_->Restore("");
    COORD_LOG_INFO("restored state backup before retry", {observability::StringField("operation", name)});
    return true;
  } catch (const util::NotFound&) {
    COORD_LOG_WARN("no checkpoint or backup to restore before retry", {observability::StringField("operation", name)});
    return false;
  }
}

OperationOutcome RecoveryManager::Run(const OperationSpec& task, const Operation& op) {
  const auto max_attempts = std::max<uint32_t>(1, task.max_attempts.value_or(options_.max_attempts));
  auto       delay        = task.base_delay.value_or(options_.base_delay);

  OperationOutcome outcome;
  outcome.history.push_back(OperationState::kAttempting);

  for (;;) {
    ++outcome.attempts;

    std::exception_ptr failure;
    try {
      op();
    } catch (const std::exception& e) {
      failure              = std::current_exception();
      outcome.last_error   = recovery::ClassifyError(e);
      outcome.last_message = e.what();
    }

    if (!failure) {
      Advance(&outcome, OperationState::kSucceeded, task.name);
      if (outcome.attempts > 1) {
        Audit("operation", task.name, "succeeded", "attempts=" + std::to_string(outcome.attempts));
      }
      return outcome;
    }

    Advance(&outcome, OperationState::kFailed, task.name);

    const auto kind   = *outcome.last_error;
    const auto action = PolicyFor(kind);
    COORD_LOG_WARN("operation failed",
                   {observability::StringField("operation", task.name), observability::IntField("attempt", outcome.attempts),
                    observability::StringField("kind", util::ToString(kind)), observability::StringField("action", ToString(action)),
                    observability::StringField("error", outcome.last_message)});

    if (action == RecoveryAction::kSurface || action == RecoveryAction::kEscalate) {
      Advance(&outcome, OperationState::kFatal, task.name);
      Audit("operation", task.name, action == RecoveryAction::kSurface ? "surfaced" : "escalated", std::string(util::ToString(kind)));
      std::rethrow_exception(failure);
    }

    if (outcome.attempts >= max_attempts) {
      if (!task.critical && !task.features.empty()) {
        Advance(&outcome, OperationState::kDegraded, task.name);
        EnterDegradedMode(task.name + " failed after " + std::to_string(outcome.attempts) + " attempts: " + outcome.last_message, task.features);
        Audit("operation", task.name, "degraded", std::string(util::ToString(kind)));
        return outcome;
      }

      Advance(&outcome, OperationState::kFatal, task.name);
      Audit("operation", task.name, "retry-exhausted", std::string(util::ToString(kind)));
      COORD_LOG_ERROR("operation exhausted retries", {observability::StringField("operation", task.name), observability::IntField("attempts", outcome.attempts)});
      throw util::RetryExhausted(task.name + " failed after " + std::to_string(outcome.attempts) + " attempts: " + outcome.last_message, kind,
                                 static_cast<int>(outcome.attempts));
    }

    try {
      if (action == RecoveryAction::kRestoreThenRetry) {
        Advance(&outcome, OperationState::kRestoring, task.name);
        RestoreForRetry(task.name, true);
      } else {
        Advance(&outcome, OperationState::kRetrying, task.name);
        if (kind == ErrorKind::kLockTimeout) {
          locks_->Cleanup();
        }
        if (checkpoints_->Latest(task.name)) {
          Advance(&outcome, OperationState::kRestoring, task.name);
          RestoreForRetry(task.name, false);
        }
      }
    } catch (const util::CoordError& e) {
      if (outcome.state == OperationState::kRestoring) {
        Advance(&outcome, OperationState::kFatal, task.name);
      }
      COORD_LOG_ERROR("recovery step failed", {observability::StringField("operation", task.name), observability::StringField("error", e.what())});
      throw;
    }

    std::this_thread::sleep_for(delay);
    delay = std::min(delay * 2, options_.max_delay);
    Advance(&outcome, OperationState::kAttempting, task.name);
  }
}

void RecoveryManager::RetryWithBackoff(const std::string& name, const Operation& op, uint32_t max_attempts, std::chrono::milliseconds base_delay) {
  OperationSpec task;
  task.name         = name;
  task.critical     = true;
  task.max_attempts = max_attempts;
  task.base_delay   = base_delay;
  Run(task, op);
}

void RecoveryManager::EnterDegradedMode(const std::string& reason, const std::vector<std::string>& features) {
  if (reason.empty()) {
    throw util::ValidationFailed("degraded mode requires a reason");
  }

  state_->Write(
      [&](coord::v1::StateDocument* doc) {
        auto* mode = doc->mutable_degraded_mode();
        if (!mode->enabled()) {
          mode->clear_disabled_features();
        }
        mode->set_enabled(true);
        mode->set_reason(reason);
        *mode->mutable_timestamp() = util::ToProto(util::Now());
        for (const auto& feature : features) {
          const auto& existing = mode->disabled_features();
          if (std::find(existing.begin(), existing.end(), feature) == existing.end()) {
            mode->add_disabled_features(feature);
          }
        }
      },
      "degrade");

  Audit("degrade", "state", "entered", reason);
  COORD_LOG_ERROR("entered degraded mode", {observability::StringField("reason", reason), observability::IntField("features", static_cast<int64_t>(features.size()))});
}

void RecoveryManager::ExitDegradedMode() {
  state_->Write(
      [](coord::v1::StateDocument* doc) {
        auto* mode = doc->mutable_degraded_mode();
        mode->set_enabled(false);
        mode->clear_reason();
        mode->clear_disabled_features();
        *mode->mutable_timestamp() = util::ToProto(util::Now());
      },
      "recover-mode");

  Audit("degrade", "state", "exited");
  COORD_LOG_INFO("left degraded mode");
}

bool RecoveryManager::IsDegraded() {
  return state_->Read().document.degraded_mode().enabled();
}

bool RecoveryManager::IsFeatureEnabled(const std::string& feature) {
  const auto mode = state_->Read().document.degraded_mode();
  if (!mode.enabled()) {
    return true;
  }
  const auto& disabled = mode.disabled_features();
  return std::find(disabled.begin(), disabled.end(), feature) == disabled.end();
}

void RecoveryManager::RequireFeature(const std::string& feature) {
  const auto mode = state_->Read().document.degraded_mode();
  if (!mode.enabled()) {
    return;
  }
  const auto& disabled = mode.disabled_features();
  if (std::find(disabled.begin(), disabled.end(), feature) != disabled.end()) {
    throw util::FeatureDisabled("feature '" + feature + "' is disabled by degraded mode: " + mode.reason());
  }
}

void RecoveryManager::SetHealthProbe(HealthProbe probe) {
  std::lock_guard lock(probe_mutex_);
  probe_ = std::move(probe);
}

bool RecoveryManager::TryAutoRecover() {
  HealthProbe probe;
  {
    std::lock_guard lock(probe_mutex_);
    probe = probe_;
  }
  if (!probe || !IsDegraded() || !probe()) {
    return false;
  }
  ExitDegradedMode();
  return true;
}

coord::v1::RecoveryStatus RecoveryManager::Status() {
  coord::v1::RecoveryStatus status;
  *status.mutable_degraded_mode() = state_->Read().document.degraded_mode();

  const auto checkpoints = checkpoints_->List();
  status.set_checkpoint_count(static_cast<uint32_t>(checkpoints.size()));
  if (!checkpoints.empty()) {
    status.set_latest_checkpoint(checkpoints.back().id());
  }
  return status;
}

void RecoveryManager::Audit(const std::string& action, const std::string& resource, const std::string& outcome, const std::string& detail) {
  audit::AuditEvent event;
  event.timestamp  = util::Now();
  event.component  = "recovery";
  event.action     = action;
  event.resource   = resource;
  event.holder_pid = util::CurrentPid();
  event.outcome    = outcome;
  event.detail     = detail;
  audit_->Record(event);
}

} // namespace coord::recovery
