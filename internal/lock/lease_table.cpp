#include "lease_table.hpp"

namespace coord::lock {

void LeaseTable::Insert(const Lease& lease) {
  std::lock_guard lock(mutex_);

  if (auto existing = leases_.find(lease.lease_id); existing != leases_.end()) {
    auto old_range = by_thread_.equal_range(existing->second.owner_thread);
    for (auto it = old_range.first; it != old_range.second; ++it) {
      if (it->second == lease.lease_id) {
        by_thread_.erase(it);
        break;
      }
    }
  }

  leases_[lease.lease_id] = lease;
  by_thread_.emplace(lease.owner_thread, lease.lease_id);
}

void LeaseTable::Remove(const std::string& lease_id) {
  std::lock_guard lock(mutex_);

  auto it = leases_.find(lease_id);
  if (it == leases_.end()) return;

  auto range = by_thread_.equal_range(it->second.owner_thread);
  for (auto i = range.first; i != range.second; ++i) {
    if (i->second == lease_id) {
      by_thread_.erase(i);
      break;
    }
  }

  leases_.erase(it);
}

std::optional<Lease> LeaseTable::Find(const std::string& lease_id) const {
  std::lock_guard lock(mutex_);

  auto it = leases_.find(lease_id);
  if (it == leases_.end()) return std::nullopt;
  return it->second;
}

std::vector<Lease> LeaseTable::HeldBy(std::thread::id thread) const {
  std::lock_guard lock(mutex_);

  std::vector<Lease> out;
  auto               range = by_thread_.equal_range(thread);
  for (auto it = range.first; it != range.second; ++it) {
    if (auto lease = leases_.find(it->second); lease != leases_.end()) {
      out.push_back(lease->second);
    }
  }
  return out;
}

bool LeaseTable::IsHeldBy(std::thread::id thread, const std::string& resource) const {
  std::lock_guard lock(mutex_);

  auto range = by_thread_.equal_range(thread);
  for (auto it = range.first; it != range.second; ++it) {
    if (auto lease = leases_.find(it->second); lease != leases_.end() && lease->second.resource == resource) {
      return true;
    }
  }
  return false;
}

size_t LeaseTable::Size() const {
  std::lock_guard lock(mutex_);
  return leases_.size();
}

} // namespace coord::lock
