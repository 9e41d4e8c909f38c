#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "coord/v1/lock.pb.h"
#include "coord/v1/report.pb.h"
#include "internal/audit/audit_trail.hpp"
#include "lease.hpp"
#include "lease_table.hpp"
#include "lock_hierarchy.hpp"

namespace coord::lock {

struct LockOptions {
  std::filesystem::path      lock_dir;
  std::chrono::milliseconds  default_timeout{30000};
  std::chrono::milliseconds  staleness_threshold{300000};
  std::chrono::milliseconds  initial_backoff{10};
  std::chrono::milliseconds  max_backoff{500};
  std::map<std::string, int> priorities;
};

/*
  Advisory inter-process locks over files in lock_dir.

    <resource>.lock                    exclusive record
    <resource>.shared.<lease>.lock     one per shared holder
    <resource>.reap                    flock serializing release and reclamation

  Lock files are published with link(2) so a visible record is always complete.
  A record is reclaimable when its holder is dead or it is older than the
  staleness threshold.
*/
class LockManager {
 public:
  LockManager(LockOptions options, std::shared_ptr<audit::AuditTrail> audit);

  // holder_pid 0 means the calling process. Throws LockTimeout, ConfigurationError.
  Lease Acquire(const std::string&                        resource,
                coord::v1::LockMode                       mode     = coord::v1::LOCK_MODE_EXCLUSIVE,
                std::optional<std::chrono::milliseconds>  timeout  = std::nullopt,
                const std::map<std::string, std::string>& metadata = {},
                pid_t                                     holder_pid = 0);

  // Throws NotHeld when the record is gone or belongs to someone else.
  void Release(const Lease& lease);

  // Releases every record on resource whose holder is pid. Returns how many; throws NotHeld on zero.
  int ReleaseHeldBy(const std::string& resource, pid_t pid);

  coord::v1::LockStatus Check(const std::string& resource);

  coord::v1::CleanupReport Cleanup(std::optional<std::chrono::milliseconds> max_age_override = std::nullopt);

  std::vector<coord::v1::LockRecord> List();

  int                      PriorityOf(const std::string& resource) const;
  std::vector<std::string> SortByPriority(const std::vector<std::string>& resources) const;

  // Sorted acquisition; on failure everything taken so far is released before rethrowing.
  std::vector<Lease> AcquireAll(const std::vector<std::string>&          resources,
                                coord::v1::LockMode                      mode    = coord::v1::LOCK_MODE_EXCLUSIVE,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  std::vector<Lease> HeldByCurrentThread() const;

  const LockOptions& Options() const {
    return options_;
  }

 private:
  using Clock = std::chrono::system_clock;

  struct Entry {
    std::filesystem::path                path;
    std::optional<coord::v1::LockRecord> record; // nullopt when unparsable
  };

  std::filesystem::path ExclusivePath(const std::string& resource) const;
  std::filesystem::path SharedPath(const std::string& resource, const std::string& lease_id) const;
  std::filesystem::path ReapPath(const std::string& resource) const;

  std::vector<Entry> SharedEntries(const std::string& resource) const;
  static std::optional<coord::v1::LockRecord> ReadRecord(const std::filesystem::path& path, bool* exists);

  bool IsReclaimable(const coord::v1::LockRecord& record, std::chrono::milliseconds threshold) const;

  enum class ReclaimResult { kHeld, kGone, kReclaimed };

  // Re-reads path under the reap flock and removes it if still reclaimable.
  ReclaimResult TryReclaim(const std::string& resource, const std::filesystem::path& path, std::chrono::milliseconds threshold);

  // Removes path only if it still carries lease_id.
  bool RemoveIfOwned(const std::string& resource, const std::filesystem::path& path, const std::string& lease_id);

  // Live shared records; reclaimable ones are removed on the way.
  size_t LiveSharedCount(const std::string& resource);

  std::chrono::milliseconds NextBackoff(std::chrono::milliseconds current) const;
  static void               SleepUntilNextAttempt(std::chrono::milliseconds backoff, Clock::time_point deadline);

  void Audit(const std::string& action, const std::string& resource, coord::v1::LockMode mode, int64_t pid, const std::string& outcome,
             int64_t duration_ms, const std::string& detail = {});

  LockOptions                        options_;
  LockHierarchy                      hierarchy_;
  LeaseTable                         table_;
  std::shared_ptr<audit::AuditTrail> audit_;
};

/*
  RAII guard. Releases on scope exit; a failing release is logged, not thrown.
*/
class ScopedLease {
 public:
  ScopedLease() = default;
  ScopedLease(LockManager& manager, Lease lease) : manager_(&manager), lease_(std::move(lease)) {
  }
  ~ScopedLease();

  ScopedLease(ScopedLease&& other) noexcept;
  ScopedLease& operator=(ScopedLease&& other) noexcept;

  ScopedLease(const ScopedLease&)            = delete;
  ScopedLease& operator=(const ScopedLease&) = delete;

  const Lease& Get() const {
    return *lease_;
  }

  bool Held() const {
    return lease_.has_value();
  }

  // Explicit release; propagates NotHeld.
  void Release();

 private:
  LockManager*         manager_ = nullptr;
  std::optional<Lease> lease_;
};

std::string ToString(coord::v1::LockMode mode);

} // namespace coord::lock
