#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "coord/v1/checkpoint.pb.h"
#include "internal/audit/audit_trail.hpp"
#include "internal/state/state_store.hpp"

namespace coord::recovery {

/*
  CheckpointStore

  Immutable snapshots under checkpoints/<id>.json, mirrored in an in-memory
  arena indexed by id. Files are created create-if-absent and never modified;
  retention removes them.
*/
class CheckpointStore {
 public:
  CheckpointStore(std::filesystem::path dir, std::shared_ptr<state::StateStore> state, std::shared_ptr<audit::AuditTrail> audit);

  coord::v1::Checkpoint Create(const std::string&                 name,
                               const std::string&                 phase,
                               const google::protobuf::Struct&    payload,
                               coord::v1::SnapshotKind            kind = coord::v1::SNAPSHOT_KIND_FULL_STATE);

  // Throws NotFound.
  coord::v1::Checkpoint Get(const std::string& id);

  // FULL_STATE snapshots are committed to the state store as a new version; returns the checkpoint.
  coord::v1::Checkpoint Restore(const std::string& id);

  // Oldest first.
  std::vector<coord::v1::Checkpoint> List();

  // Newest checkpoint with this name (any name when empty).
  std::optional<coord::v1::Checkpoint> Latest(const std::string& name = {});

  // Keeps the newest retention_count and drops anything older than retention_age. Returns removed ids.
  std::vector<std::string> Prune(uint32_t retention_count, std::chrono::milliseconds retention_age);

 private:
  // Loads files written by other processes; drops entries whose file vanished.
  void RefreshLocked();

  std::filesystem::path PathFor(const std::string& id) const;

  std::filesystem::path              dir_;
  std::shared_ptr<state::StateStore> state_;
  std::shared_ptr<audit::AuditTrail> audit_;

  std::mutex                                   mutex_;
  std::map<std::string, coord::v1::Checkpoint> arena_;
};

} // namespace coord::recovery
