#include "checkpoint_store.hpp"

#include <algorithm>
#include <set>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/json.hpp"
#include "internal/util/path_utils.hpp"
#include "internal/util/process.hpp"
#include "internal/util/time.hpp"

namespace coord::recovery {

using coord::v1::Checkpoint;

namespace {

bool NewerThan(const Checkpoint& a, const Checkpoint& b) {
  if (a.created_at().seconds() != b.created_at().seconds()) return a.created_at().seconds() > b.created_at().seconds();
  if (a.created_at().nanos() != b.created_at().nanos()) return a.created_at().nanos() > b.created_at().nanos();
  return a.id() > b.id();
}

} // namespace

CheckpointStore::CheckpointStore(std::filesystem::path dir, std::shared_ptr<state::StateStore> state, std::shared_ptr<audit::AuditTrail> audit)
    : dir_(std::move(dir)), state_(std::move(state)), audit_(audit ? std::move(audit) : std::make_shared<audit::NullAuditTrail>()) {
}

std::filesystem::path CheckpointStore::PathFor(const std::string& id) const {
  util::ValidateComponent(id, "checkpoint id");
  return dir_ / (id + ".json");
}

void CheckpointStore::RefreshLocked() {
  std::set<std::string> seen;

  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
    const auto name = entry.path().filename().string();
    if (entry.path().extension() != ".json" || name.find(".tmp.") != std::string::npos) continue;

    const auto id = entry.path().stem().string();
    seen.insert(id);
    if (arena_.count(id)) continue;

    try {
      arena_[id] = util::ParseJsonAs<Checkpoint>(util::ReadFile(entry.path()));
    } catch (const util::NotFound&) {
      seen.erase(id);
    } catch (const util::ValidationFailed& e) {
      COORD_LOG_WARN("ignoring unreadable checkpoint", {observability::StringField("path", entry.path().string()), observability::StringField("error", e.what())});
      seen.erase(id);
    }
  }

  for (auto it = arena_.begin(); it != arena_.end();) {
    it = seen.count(it->first) ? std::next(it) : arena_.erase(it);
  }
}

Checkpoint CheckpointStore::Create(const std::string& name, const std::string& phase, const google::protobuf::Struct& payload, coord::v1::SnapshotKind kind) {
  const auto clean = util::Sanitize(name);
  if (clean.empty()) {
    throw util::ValidationFailed("checkpoint name must contain at least one of [a-z0-9._-]: '" + name + "'");
  }
  if (kind == coord::v1::SNAPSHOT_KIND_UNSPECIFIED) {
    kind = coord::v1::SNAPSHOT_KIND_FULL_STATE;
  }

  Checkpoint checkpoint;
  checkpoint.set_name(name);
  checkpoint.set_kind(kind);
  *checkpoint.mutable_payload() = payload;
  checkpoint.set_holder_pid(util::CurrentPid());
  checkpoint.set_hostname(util::Hostname());

  std::string phase_at_capture = phase;
  if (kind == coord::v1::SNAPSHOT_KIND_FULL_STATE) {
    auto snapshot = state_->Read();
    if (phase_at_capture.empty()) phase_at_capture = snapshot.document.phase();
    *checkpoint.mutable_state_snapshot() = std::move(snapshot.document);
  }
  checkpoint.set_phase_at_capture(phase_at_capture);

  util::EnsureDirectory(dir_);

  const auto now  = util::Now();
  const auto base = "checkpoint-" + util::CompactUtc(now) + "-" + clean;
  *checkpoint.mutable_created_at() = util::ToProto(now);

  for (int attempt = 0;; ++attempt) {
    const auto id = attempt == 0 ? base : base + "-" + std::to_string(attempt + 1);
    checkpoint.set_id(id);
    if (util::CreateExclusive(PathFor(id), util::ToJson(checkpoint))) {
      break;
    }
  }

  {
    std::lock_guard lock(mutex_);
    arena_[checkpoint.id()] = checkpoint;
  }

  audit::AuditEvent event;
  event.timestamp  = now;
  event.component  = "recovery";
  event.action     = "checkpoint";
  event.resource   = checkpoint.id();
  event.holder_pid = checkpoint.holder_pid();
  event.outcome    = kind == coord::v1::SNAPSHOT_KIND_FULL_STATE ? "full-state" : "payload-only";
  audit_->Record(event);

  COORD_LOG_INFO("checkpoint created", {observability::StringField("id", checkpoint.id()), observability::StringField("phase", phase_at_capture)});
  return checkpoint;
}

Checkpoint CheckpointStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);

  if (auto it = arena_.find(id); it != arena_.end()) {
    return it->second;
  }

  try {
    auto checkpoint = util::ParseJsonAs<Checkpoint>(util::ReadFile(PathFor(id)));
    arena_[id]      = checkpoint;
    return checkpoint;
  } catch (const util::NotFound&) {
    throw util::NotFound("checkpoint not found: " + id);
  }
}

Checkpoint CheckpointStore::Restore(const std::string& id) {
  auto checkpoint = Get(id);

  if (checkpoint.kind() == coord::v1::SNAPSHOT_KIND_FULL_STATE) {
    if (!checkpoint.has_state_snapshot()) {
      throw util::StateCorruption("checkpoint " + id + " is full-state but carries no snapshot");
    }
    state_->Validate(checkpoint.state_snapshot());
    const auto snapshot = checkpoint.state_snapshot();
    state_->Write([&](coord::v1::StateDocument* doc) { *doc = snapshot; }, "checkpoint-restore");
  }

  audit::AuditEvent event;
  event.timestamp  = util::Now();
  event.component  = "recovery";
  event.action     = "restore";
  event.resource   = id;
  event.holder_pid = util::CurrentPid();
  event.outcome    = "restored";
  audit_->Record(event);

  COORD_LOG_INFO("checkpoint restored", {observability::StringField("id", id), observability::StringField("phase", checkpoint.phase_at_capture())});
  return checkpoint;
}

std::vector<Checkpoint> CheckpointStore::List() {
  std::lock_guard lock(mutex_);
  RefreshLocked();

  std::vector<Checkpoint> out;
  out.reserve(arena_.size());
  for (const auto& [id, checkpoint] : arena_) {
    out.push_back(checkpoint);
  }
  std::sort(out.begin(), out.end(), [](const Checkpoint& a, const Checkpoint& b) { return NewerThan(b, a); });
  return out;
}

std::optional<Checkpoint> CheckpointStore::Latest(const std::string& name) {
  std::optional<Checkpoint> latest;
  for (auto& checkpoint : List()) {
    if (!name.empty() && checkpoint.name() != name) continue;
    latest = std::move(checkpoint);
  }
  return latest;
}

std::vector<std::string> CheckpointStore::Prune(uint32_t retention_count, std::chrono::milliseconds retention_age) {
  auto       all = List();
  const auto now = util::Now();
  std::reverse(all.begin(), all.end());

  std::vector<std::string> removed;
  for (size_t i = 0; i < all.size(); ++i) {
    const bool over_count = i >= retention_count;
    const bool too_old    = now - util::FromProto(all[i].created_at()) > retention_age;
    if (!over_count && !too_old) continue;

    if (util::RemoveFile(PathFor(all[i].id()))) {
      removed.push_back(all[i].id());
    }
  }

  {
    std::lock_guard lock(mutex_);
    for (const auto& id : removed) arena_.erase(id);
  }

  if (!removed.empty()) {
    COORD_LOG_INFO("pruned checkpoints", {observability::IntField("removed", static_cast<int64_t>(removed.size()))});
  }
  return removed;
}

} // namespace coord::recovery
