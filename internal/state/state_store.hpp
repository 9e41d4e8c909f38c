#pragma once

#include <memory>
#include <string>
#include <vector>

#include "coord/v1/report.pb.h"
#include "coord/v1/state.pb.h"
#include "document_store.hpp"
#include "state_schema.hpp"

namespace coord::state {

using StateReadOutcome = ReadOutcome<coord::v1::StateDocument>;

/*
  StateStore

  The single shared pipeline document. All mutations go through Write so they
  are serialized by the "state" lock, validated and backed up.
*/
class StateStore {
 public:
  static constexpr char kLockResource[] = "state";

  StateStore(DocumentStoreOptions options, std::shared_ptr<const StateSchema> schema, std::shared_ptr<lock::LockManager> locks,
             std::shared_ptr<audit::AuditTrail> audit);

  StateReadOutcome Init();
  StateReadOutcome Read();

  coord::v1::StateDocument Write(const std::function<void(coord::v1::StateDocument*)>& mutator, const std::string& label);

  // Throws ValidationFailed.
  void Validate(const coord::v1::StateDocument& doc) const;

  coord::v1::BackupInfo              Backup(const std::string& label);
  coord::v1::StateDocument           Restore(const std::string& selector);
  std::vector<coord::v1::BackupInfo> ListBackups() const;
  std::vector<std::string>           PruneBackups() const;
  bool                               Migrate();

  coord::v1::StateStatus Status();

  coord::v1::StateDocument ApplyPatch(const std::string& patch_json, const std::string& label);

  // Convenience mutations used by other components.
  coord::v1::StateDocument SetPhase(const std::string& phase, const std::string& label);
  coord::v1::StateDocument CompleteUnit(const std::string& unit, const std::string& signal);
  coord::v1::StateDocument RaiseSignal(const std::string& signal);
  coord::v1::StateDocument SetDegradedMode(const coord::v1::DegradedMode& mode, const std::string& label);

  const StateSchema& Schema() const {
    return *schema_;
  }

  const DocumentStoreOptions& Options() const {
    return store_.Options();
  }

 private:
  std::shared_ptr<const StateSchema>        schema_;
  std::shared_ptr<lock::LockManager>        locks_;
  DocumentStore<coord::v1::StateDocument>   store_;
};

} // namespace coord::state
