#include "workspace_index.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/path_utils.hpp"
#include "workspace_state.hpp"

namespace coord::workspace {

namespace {

void ValidateRecord(const coord::v1::WorkspaceRecord& record, const std::string& where) {
  if (record.name().empty() || util::Sanitize(record.name()) != record.name()) {
    throw util::ValidationFailed(where + ": invalid workspace name '" + record.name() + "'");
  }
  if (record.status() == coord::v1::WORKSPACE_STATUS_UNSPECIFIED) {
    throw util::ValidationFailed(where + ": status is required");
  }
  if (record.branch().empty()) {
    throw util::ValidationFailed(where + ": branch is required");
  }
  if (record.status() == coord::v1::WORKSPACE_STATUS_CONFLICT && record.conflict_paths_size() == 0) {
    throw util::ValidationFailed(where + ": conflict status requires conflict paths");
  }
  if (record.status() == coord::v1::WORKSPACE_STATUS_MERGED && record.merge_commit().empty()) {
    throw util::ValidationFailed(where + ": merged status requires a merge commit");
  }
}

} // namespace

coord::v1::WorkspaceIndex WorkspaceIndexSchema::Default() const {
  return coord::v1::WorkspaceIndex{};
}

void WorkspaceIndexSchema::Validate(const coord::v1::WorkspaceIndex& index) const {
  for (const auto& [name, record] : index.workspaces()) {
    if (name != record.name()) {
      throw util::ValidationFailed("workspaces." + name + ": key does not match record name '" + record.name() + "'");
    }
    ValidateRecord(record, "workspaces." + name);
  }
  for (int i = 0; i < index.history_size(); ++i) {
    const auto& record = index.history(i);
    const auto  where  = "history[" + std::to_string(i) + "]";
    ValidateRecord(record, where);
    if (!IsTerminal(record.status())) {
      throw util::ValidationFailed(where + ": history holds only archived or failed records");
    }
  }
}

std::shared_ptr<WorkspaceIndexStore> MakeIndexStore(state::DocumentStoreOptions options, std::shared_ptr<lock::LockManager> locks,
                                                    std::shared_ptr<audit::AuditTrail> audit) {
  options.name = kIndexLockResource;
  if (options.backup_prefix.empty()) options.backup_prefix = "index";
  return std::make_shared<WorkspaceIndexStore>(std::move(options), std::make_shared<const WorkspaceIndexSchema>(), std::move(locks),
                                               std::move(audit));
}

} // namespace coord::workspace
