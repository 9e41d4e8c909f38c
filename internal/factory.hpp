#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/audit/audit_trail.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/recovery/checkpoint_store.hpp"
#include "internal/recovery/recovery_manager.hpp"
#include "internal/state/state_store.hpp"
#include "internal/workspace/workspace_index.hpp"
#include "internal/workspace/workspace_manager.hpp"

namespace coord::factory {

/*
  Runtime

  Every long-lived component of one coordctl invocation.
*/
struct Runtime {
  coord::runtime::config::RuntimeConfig config;
  config::ResolvedPaths                 paths;

  std::shared_ptr<audit::AuditTrail>             audit;
  std::shared_ptr<lock::LockManager>             locks;
  std::shared_ptr<state::StateStore>             state;
  std::shared_ptr<recovery::CheckpointStore>     checkpoints;
  std::shared_ptr<recovery::RecoveryManager>     recovery;
  std::shared_ptr<workspace::WorkspaceIndexStore> workspace_index;
  std::shared_ptr<workspace::WorkspaceManager>   workspaces;
};

/*
  Build

  Composition root: the only place that knows concrete audit and VCS types.
  Constructing the runtime touches nothing on disk except the coordination
  root and the audit database.
*/
Runtime Build(const coord::runtime::config::RuntimeConfig& config);

// Same as Build with an audit trail supplied by the caller (tests).
Runtime Build(const coord::runtime::config::RuntimeConfig& config, std::shared_ptr<audit::AuditTrail> audit);

} // namespace coord::factory
