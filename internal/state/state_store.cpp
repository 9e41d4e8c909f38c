#include "state_store.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace coord::state {

using coord::v1::StateDocument;

StateStore::StateStore(DocumentStoreOptions options, std::shared_ptr<const StateSchema> schema, std::shared_ptr<lock::LockManager> locks,
                       std::shared_ptr<audit::AuditTrail> audit)
    : schema_(schema), locks_(locks), store_(std::move(options), schema, locks, std::move(audit)) {
}

StateReadOutcome StateStore::Init() {
  return store_.Init();
}

StateReadOutcome StateStore::Read() {
  return store_.Read();
}

StateDocument StateStore::Write(const std::function<void(StateDocument*)>& mutator, const std::string& label) {
  return store_.Write(mutator, label);
}

void StateStore::Validate(const StateDocument& doc) const {
  store_.Validate(doc);
}

coord::v1::BackupInfo StateStore::Backup(const std::string& label) {
  return store_.Backup(label);
}

StateDocument StateStore::Restore(const std::string& selector) {
  return store_.Restore(selector);
}

std::vector<coord::v1::BackupInfo> StateStore::ListBackups() const {
  return store_.ListBackups();
}

std::vector<std::string> StateStore::PruneBackups() const {
  return store_.PruneBackups();
}

bool StateStore::Migrate() {
  return store_.Migrate();
}

coord::v1::StateStatus StateStore::Status() {
  coord::v1::StateStatus status;
  status.set_state_file(store_.Options().file.string());
  status.set_backup_count(static_cast<uint32_t>(store_.ListBackups().size()));
  status.set_active_locks(static_cast<uint32_t>(locks_->List().size()));

  try {
    auto outcome = store_.Read();
    status.set_exists(outcome.exists);
    status.set_valid(true);
    status.set_phase(outcome.document.phase());
    status.set_version(outcome.document.version());
    status.set_schema_version(outcome.document.schema_version());
    *status.mutable_degraded_mode() = outcome.document.degraded_mode();
    if (outcome.recovered) {
      status.set_validation_error("recovered from " + outcome.recovered_from);
    }
  } catch (const util::CoordError& e) {
    status.set_valid(false);
    status.set_validation_error(e.what());
  }
  return status;
}

StateDocument StateStore::ApplyPatch(const std::string& patch_json, const std::string& label) {
  return store_.Write([&](StateDocument* doc) { state::ApplyPatch(patch_json, doc); }, label.empty() ? "patch" : label);
}

StateDocument StateStore::SetPhase(const std::string& phase, const std::string& label) {
  return store_.Write([&](StateDocument* doc) { doc->set_phase(phase); }, label.empty() ? "phase-" + phase : label);
}

StateDocument StateStore::CompleteUnit(const std::string& unit, const std::string& signal) {
  return store_.Write(
      [&](StateDocument* doc) {
        const auto& units = doc->completed_units();
        if (std::find(units.begin(), units.end(), unit) == units.end()) {
          doc->add_completed_units(unit);
        }
        if (!signal.empty()) {
          (*doc->mutable_signals())[signal] = util::ToProto(util::Now());
        }
      },
      "complete-" + unit);
}

StateDocument StateStore::RaiseSignal(const std::string& signal) {
  if (signal.empty()) {
    throw util::ValidationFailed("signal name must not be empty");
  }
  return store_.Write([&](StateDocument* doc) { (*doc->mutable_signals())[signal] = util::ToProto(util::Now()); }, "signal-" + signal);
}

StateDocument StateStore::SetDegradedMode(const coord::v1::DegradedMode& mode, const std::string& label) {
  return store_.Write([&](StateDocument* doc) { *doc->mutable_degraded_mode() = mode; }, label);
}

} // namespace coord::state
