#include "lock_manager.hpp"

#include <algorithm>
#include <random>
#include <system_error>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/json.hpp"
#include "internal/util/path_utils.hpp"
#include "internal/util/process.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace coord::lock {

using coord::v1::LockMode;
using coord::v1::LockRecord;
using namespace std::chrono;

namespace {

constexpr char kLockSuffix[]   = ".lock";
constexpr char kSharedInfix[]  = ".shared.";
constexpr char kReapSuffix[]   = ".reap";

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void ValidateResource(const std::string& resource) {
  util::ValidateComponent(resource, "lock resource");
  if (resource.find(kSharedInfix) != std::string::npos || resource.find(".tmp.") != std::string::npos || EndsWith(resource, kLockSuffix) ||
      EndsWith(resource, kReapSuffix)) {
    throw util::ValidationFailed("lock resource uses a reserved suffix: " + resource);
  }
}

bool IsLockFile(const std::string& name) {
  return EndsWith(name, kLockSuffix) && name.find(".tmp.") == std::string::npos;
}

std::string ResourceFromFile(const std::string& name) {
  if (auto pos = name.find(kSharedInfix); pos != std::string::npos) {
    return name.substr(0, pos);
  }
  return name.substr(0, name.size() - (sizeof(kLockSuffix) - 1));
}

bool Exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

std::mt19937_64& Rng() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

std::string ToString(LockMode mode) {
  switch (mode) {
    case coord::v1::LOCK_MODE_EXCLUSIVE:
      return "exclusive";
    case coord::v1::LOCK_MODE_SHARED:
      return "shared";
    default:
      return "unspecified";
  }
}

LockManager::LockManager(LockOptions options, std::shared_ptr<audit::AuditTrail> audit)
    : options_(std::move(options)), hierarchy_(options_.priorities), audit_(std::move(audit)) {
  if (!audit_) {
    audit_ = std::make_shared<audit::NullAuditTrail>();
  }
}

std::filesystem::path LockManager::ExclusivePath(const std::string& resource) const {
  return options_.lock_dir / (resource + kLockSuffix);
}

std::filesystem::path LockManager::SharedPath(const std::string& resource, const std::string& lease_id) const {
  return options_.lock_dir / (resource + kSharedInfix + lease_id + kLockSuffix);
}

std::filesystem::path LockManager::ReapPath(const std::string& resource) const {
  return options_.lock_dir / (resource + kReapSuffix);
}

std::optional<LockRecord> LockManager::ReadRecord(const std::filesystem::path& path, bool* exists) {
  std::string body;
  try {
    body = util::ReadFile(path);
  } catch (const util::NotFound&) {
    *exists = false;
    return std::nullopt;
  }
  *exists = true;

  LockRecord record;
  try {
    util::ParseJson(body, &record);
  } catch (const util::ValidationFailed&) {
    return std::nullopt;
  }
  return record;
}

std::vector<LockManager::Entry> LockManager::SharedEntries(const std::string& resource) const {
  std::vector<Entry> out;
  const auto         prefix = resource + kSharedInfix;

  std::error_code ec;
  for (const auto& file : std::filesystem::directory_iterator(options_.lock_dir, ec)) {
    const auto name = file.path().filename().string();
    if (name.rfind(prefix, 0) != 0 || !IsLockFile(name)) continue;

    bool exists = false;
    auto record = ReadRecord(file.path(), &exists);
    if (!exists) continue;
    out.push_back({file.path(), std::move(record)});
  }
  return out;
}

bool LockManager::IsReclaimable(const LockRecord& record, milliseconds threshold) const {
  const auto age = Clock::now() - util::FromProto(record.acquired_at());
  if (age > threshold) {
    return true;
  }
  return !util::IsSameProcessAlive(static_cast<pid_t>(record.holder_pid()), record.holder_start_time());
}

LockManager::ReclaimResult LockManager::TryReclaim(const std::string& resource, const std::filesystem::path& path, milliseconds threshold) {
  util::FileLock guard(ReapPath(resource));

  bool exists = false;
  auto record = ReadRecord(path, &exists);
  if (!exists) {
    return ReclaimResult::kGone;
  }
  if (record && !IsReclaimable(*record, threshold)) {
    return ReclaimResult::kHeld;
  }

  if (!util::RemoveFile(path)) {
    return ReclaimResult::kGone;
  }

  std::string reason = "corrupt";
  if (record) {
    const auto alive = util::IsSameProcessAlive(static_cast<pid_t>(record->holder_pid()), record->holder_start_time());
    reason           = alive ? "expired" : "dead-holder";
  }

  const auto pid = record ? record->holder_pid() : 0;
  COORD_LOG_WARN("reclaimed stale lock",
                 {observability::StringField("resource", resource), observability::IntField("holder_pid", pid),
                  observability::StringField("reason", reason), observability::StringField("path", path.string())});
  Audit("reclaim", resource, record ? record->mode() : coord::v1::LOCK_MODE_UNSPECIFIED, pid, reason, 0, path.filename().string());
  return ReclaimResult::kReclaimed;
}

bool LockManager::RemoveIfOwned(const std::string& resource, const std::filesystem::path& path, const std::string& lease_id) {
  util::FileLock guard(ReapPath(resource));

  bool exists = false;
  auto record = ReadRecord(path, &exists);
  if (!exists || !record || record->lease_id() != lease_id) {
    return false;
  }
  return util::RemoveFile(path);
}

size_t LockManager::LiveSharedCount(const std::string& resource) {
  size_t live = 0;
  for (const auto& entry : SharedEntries(resource)) {
    if (entry.record && !IsReclaimable(*entry.record, options_.staleness_threshold)) {
      ++live;
      continue;
    }
    if (TryReclaim(resource, entry.path, options_.staleness_threshold) == ReclaimResult::kHeld) {
      ++live;
    }
  }
  return live;
}

milliseconds LockManager::NextBackoff(milliseconds current) const {
  return std::min(current * 2, options_.max_backoff);
}

void LockManager::SleepUntilNextAttempt(milliseconds backoff, Clock::time_point deadline) {
  std::uniform_int_distribution<int64_t> jitter(backoff.count() / 2, std::max<int64_t>(backoff.count(), 1));

  auto delay     = milliseconds(jitter(Rng()));
  auto remaining = duration_cast<milliseconds>(deadline - Clock::now());
  if (remaining < delay) delay = remaining;
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
}

void LockManager::Audit(const std::string& action, const std::string& resource, LockMode mode, int64_t pid, const std::string& outcome,
                        int64_t duration_ms, const std::string& detail) {
  audit::AuditEvent event;
  event.timestamp   = util::Now();
  event.component   = "lock";
  event.action      = action;
  event.resource    = resource;
  event.mode        = ToString(mode);
  event.holder_pid  = pid;
  event.outcome     = outcome;
  event.duration_ms = duration_ms;
  event.detail      = detail;
  audit_->Record(event);
}

Lease LockManager::Acquire(const std::string&                        resource,
                           LockMode                                  mode,
                           std::optional<milliseconds>               timeout,
                           const std::map<std::string, std::string>& metadata,
                           pid_t                                     holder_pid) {
  ValidateResource(resource);
  if (mode == coord::v1::LOCK_MODE_UNSPECIFIED) {
    mode = coord::v1::LOCK_MODE_EXCLUSIVE;
  }

  const auto self = std::this_thread::get_id();
  const auto held = table_.HeldBy(self);
  for (const auto& lease : held) {
    if (lease.resource == resource) {
      throw util::InvalidState("lock '" + resource + "' is already held by this thread");
    }
  }
  hierarchy_.CheckOrder(held, resource);

  util::EnsureDirectory(options_.lock_dir);

  const auto started  = Clock::now();
  const auto wait     = timeout.value_or(options_.default_timeout);
  const auto deadline = started + wait;

  Lease lease;
  lease.lease_id     = util::NewId();
  lease.resource     = resource;
  lease.mode         = mode;
  lease.holder_pid   = holder_pid > 0 ? holder_pid : util::CurrentPid();
  lease.owner_thread = self;
  lease.path         = mode == coord::v1::LOCK_MODE_EXCLUSIVE ? ExclusivePath(resource) : SharedPath(resource, lease.lease_id);

  LockRecord record;
  record.set_resource_name(resource);
  record.set_mode(mode);
  record.set_holder_pid(lease.holder_pid);
  record.set_lease_id(lease.lease_id);
  record.set_hostname(util::Hostname());
  record.set_holder_start_time(util::ProcessStartTime(lease.holder_pid));
  for (const auto& [key, value] : metadata) {
    (*record.mutable_metadata())[key] = value;
  }

  const auto exclusive_path = ExclusivePath(resource);
  auto       backoff        = options_.initial_backoff;
  bool       published      = false;

  try {
    for (;;) {
      if (!published) {
        const auto now = Clock::now();
        *record.mutable_acquired_at() = util::ToProto(now);
        *record.mutable_expires_at()  = util::ToProto(now + options_.staleness_threshold);
        const auto body               = util::ToJson(record, false);

        if (mode == coord::v1::LOCK_MODE_EXCLUSIVE) {
          if (util::CreateExclusive(lease.path, body)) {
            published = true;
            continue;
          }
          if (TryReclaim(resource, lease.path, options_.staleness_threshold) != ReclaimResult::kHeld) {
            continue;
          }
        } else if (!Exists(exclusive_path)) {
          if (util::CreateExclusive(lease.path, body)) {
            if (!Exists(exclusive_path)) {
              break;
            }
            // A writer slipped in between; step back so it can drain readers.
            util::RemoveFile(lease.path);
          }
        } else if (TryReclaim(resource, exclusive_path, options_.staleness_threshold) != ReclaimResult::kHeld) {
          continue;
        }
      } else if (LiveSharedCount(resource) == 0) {
        break;
      }

      if (Clock::now() >= deadline) {
        if (published) {
          RemoveIfOwned(resource, lease.path, lease.lease_id);
        }

        bool       exists = false;
        const auto holder = ReadRecord(exclusive_path, &exists);
        const auto waited = duration_cast<milliseconds>(Clock::now() - started).count();
        std::string detail = published ? "waiting for shared holders" : "contended";
        if (holder) detail += " holder_pid=" + std::to_string(holder->holder_pid());

        COORD_LOG_WARN("lock acquire timed out",
                       {observability::StringField("resource", resource), observability::StringField("mode", ToString(mode)),
                        observability::IntField("waited_ms", waited), observability::StringField("detail", detail)});
        Audit("acquire", resource, mode, lease.holder_pid, "timeout", waited, detail);
        throw util::LockTimeout("timed out after " + std::to_string(waited) + "ms waiting for " + ToString(mode) + " lock '" + resource + "' (" +
                                detail + ")");
      }

      SleepUntilNextAttempt(backoff, deadline);
      backoff = NextBackoff(backoff);
    }
  } catch (const util::LockTimeout&) {
    throw;
  } catch (...) {
    if (published) {
      RemoveIfOwned(resource, lease.path, lease.lease_id);
    }
    throw;
  }

  lease.acquired_at = util::FromProto(record.acquired_at());
  lease.expires_at  = util::FromProto(record.expires_at());
  table_.Insert(lease);

  const auto waited = duration_cast<milliseconds>(Clock::now() - started).count();
  COORD_LOG_DEBUG("lock acquired", {observability::StringField("resource", resource), observability::StringField("mode", ToString(mode)),
                                    observability::IntField("holder_pid", lease.holder_pid), observability::IntField("waited_ms", waited)});
  Audit("acquire", resource, mode, lease.holder_pid, "acquired", waited, lease.lease_id);
  return lease;
}

void LockManager::Release(const Lease& lease) {
  const bool removed = RemoveIfOwned(lease.resource, lease.path, lease.lease_id);
  table_.Remove(lease.lease_id);

  const auto held_ms = duration_cast<milliseconds>(Clock::now() - lease.acquired_at).count();
  Audit("release", lease.resource, lease.mode, lease.holder_pid, removed ? "released" : "not-held", held_ms, lease.lease_id);

  if (!removed) {
    COORD_LOG_WARN("released lock was no longer held",
                   {observability::StringField("resource", lease.resource), observability::StringField("lease_id", lease.lease_id)});
    throw util::NotHeld("lock '" + lease.resource + "' is no longer held by lease " + lease.lease_id);
  }
  COORD_LOG_DEBUG("lock released", {observability::StringField("resource", lease.resource), observability::IntField("held_ms", held_ms)});
}

int LockManager::ReleaseHeldBy(const std::string& resource, pid_t pid) {
  ValidateResource(resource);

  std::vector<Entry> entries = SharedEntries(resource);
  bool               exists  = false;
  if (auto record = ReadRecord(ExclusivePath(resource), &exists); exists) {
    entries.push_back({ExclusivePath(resource), std::move(record)});
  }

  int released = 0;
  for (const auto& entry : entries) {
    if (!entry.record || entry.record->holder_pid() != pid) continue;
    if (RemoveIfOwned(resource, entry.path, entry.record->lease_id())) {
      table_.Remove(entry.record->lease_id());
      Audit("release", resource, entry.record->mode(), pid, "released", 0, entry.record->lease_id());
      ++released;
    }
  }

  if (released == 0) {
    throw util::NotHeld("no lock on '" + resource + "' is held by pid " + std::to_string(pid));
  }
  return released;
}

coord::v1::LockStatus LockManager::Check(const std::string& resource) {
  ValidateResource(resource);

  coord::v1::LockStatus status;
  status.set_resource_name(resource);

  std::vector<Entry> entries;
  bool               exists = false;
  if (auto record = ReadRecord(ExclusivePath(resource), &exists); exists) {
    entries.push_back({ExclusivePath(resource), std::move(record)});
  }
  for (auto& entry : SharedEntries(resource)) {
    entries.push_back(std::move(entry));
  }

  bool all_reclaimable = true;
  for (const auto& entry : entries) {
    auto* holder = status.add_holders();
    if (!entry.record) {
      holder->set_reclaimable(true);
      continue;
    }
    const auto age         = duration_cast<milliseconds>(Clock::now() - util::FromProto(entry.record->acquired_at()));
    const bool reclaimable = IsReclaimable(*entry.record, options_.staleness_threshold);
    holder->set_holder_pid(entry.record->holder_pid());
    holder->set_mode(entry.record->mode());
    holder->set_age_ms(age.count());
    holder->set_lease_id(entry.record->lease_id());
    holder->set_reclaimable(reclaimable);
    all_reclaimable = all_reclaimable && reclaimable;
  }

  if (entries.empty()) {
    status.set_state(coord::v1::LOCK_STATE_FREE);
  } else if (all_reclaimable) {
    status.set_state(coord::v1::LOCK_STATE_STALE);
  } else {
    status.set_state(coord::v1::LOCK_STATE_HELD);
  }
  return status;
}

coord::v1::CleanupReport LockManager::Cleanup(std::optional<milliseconds> max_age_override) {
  const auto threshold = max_age_override.value_or(options_.staleness_threshold);

  coord::v1::CleanupReport report;

  std::error_code ec;
  if (!std::filesystem::is_directory(options_.lock_dir, ec)) {
    return report;
  }

  std::vector<std::filesystem::path> candidates;
  for (const auto& file : std::filesystem::directory_iterator(options_.lock_dir, ec)) {
    if (IsLockFile(file.path().filename().string())) {
      candidates.push_back(file.path());
    }
  }
  std::sort(candidates.begin(), candidates.end());

  for (const auto& path : candidates) {
    const auto resource = ResourceFromFile(path.filename().string());
    if (TryReclaim(resource, path, threshold) == ReclaimResult::kReclaimed) {
      report.set_reclaimed(report.reclaimed() + 1);
      report.add_removed(path.string());
    }
  }

  // Temp files left behind by a publisher that died mid-write.
  util::RemoveStaleTempFiles(options_.lock_dir, duration_cast<seconds>(threshold));

  COORD_LOG_INFO("lock cleanup finished",
                 {observability::IntField("reclaimed", report.reclaimed()), observability::IntField("threshold_ms", threshold.count())});
  return report;
}

std::vector<LockRecord> LockManager::List() {
  std::vector<LockRecord> out;

  std::error_code ec;
  for (const auto& file : std::filesystem::directory_iterator(options_.lock_dir, ec)) {
    if (!IsLockFile(file.path().filename().string())) continue;
    bool exists = false;
    auto record = ReadRecord(file.path(), &exists);
    if (!exists) continue;
    if (!record) {
      COORD_LOG_WARN("unreadable lock record", {observability::StringField("path", file.path().string())});
      continue;
    }
    out.push_back(std::move(*record));
  }

  std::sort(out.begin(), out.end(), [](const LockRecord& a, const LockRecord& b) {
    return a.resource_name() != b.resource_name() ? a.resource_name() < b.resource_name() : a.lease_id() < b.lease_id();
  });
  return out;
}

int LockManager::PriorityOf(const std::string& resource) const {
  return hierarchy_.PriorityOf(resource);
}

std::vector<std::string> LockManager::SortByPriority(const std::vector<std::string>& resources) const {
  return hierarchy_.Sort(resources);
}

std::vector<Lease> LockManager::AcquireAll(const std::vector<std::string>& resources, LockMode mode, std::optional<milliseconds> timeout) {
  std::vector<Lease> acquired;
  try {
    for (const auto& resource : SortByPriority(resources)) {
      acquired.push_back(Acquire(resource, mode, timeout));
    }
  } catch (const util::CoordError&) {
    for (auto it = acquired.rbegin(); it != acquired.rend(); ++it) {
      try {
        Release(*it);
      } catch (const util::NotHeld& e) {
        COORD_LOG_WARN("rollback release failed", {observability::StringField("resource", it->resource), observability::StringField("error", e.what())});
      }
    }
    throw;
  }
  return acquired;
}

std::vector<Lease> LockManager::HeldByCurrentThread() const {
  return table_.HeldBy(std::this_thread::get_id());
}

// ------------------------------------------------------------
// ScopedLease
// ------------------------------------------------------------

ScopedLease::~ScopedLease() {
  if (!manager_ || !lease_) return;
  try {
    manager_->Release(*lease_);
  } catch (const util::CoordError& e) {
    COORD_LOG_ERROR("scoped lock release failed", {observability::StringField("resource", lease_->resource), observability::StringField("error", e.what())});
  }
}

ScopedLease::ScopedLease(ScopedLease&& other) noexcept : manager_(other.manager_), lease_(std::move(other.lease_)) {
  other.lease_.reset();
}

ScopedLease& ScopedLease::operator=(ScopedLease&& other) noexcept {
  if (this != &other) {
    if (manager_ && lease_) {
      try {
        manager_->Release(*lease_);
      } catch (const util::CoordError& e) {
        COORD_LOG_ERROR("scoped lock release failed", {observability::StringField("resource", lease_->resource), observability::StringField("error", e.what())});
      }
    }
    manager_ = other.manager_;
    lease_   = std::move(other.lease_);
    other.lease_.reset();
  }
  return *this;
}

void ScopedLease::Release() {
  if (!manager_ || !lease_) return;
  auto lease = std::move(*lease_);
  lease_.reset();
  manager_->Release(lease);
}

} // namespace coord::lock
