#pragma once

#include <memory>

#include "coord/v1/workspace.pb.h"
#include "internal/state/document_store.hpp"

namespace coord::workspace {

/*
  Rules for the workspace index: keys match record names, every record has a
  status and a branch, history only holds terminal records.
*/
class WorkspaceIndexSchema final : public state::DocumentSchema<coord::v1::WorkspaceIndex> {
 public:
  coord::v1::WorkspaceIndex Default() const override;

  void Validate(const coord::v1::WorkspaceIndex& index) const override;
};

using WorkspaceIndexStore = state::DocumentStore<coord::v1::WorkspaceIndex>;

inline constexpr char kIndexLockResource[] = "workspace-index";

std::shared_ptr<WorkspaceIndexStore> MakeIndexStore(state::DocumentStoreOptions options, std::shared_ptr<lock::LockManager> locks,
                                                    std::shared_ptr<audit::AuditTrail> audit);

} // namespace coord::workspace
