#pragma once

#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

#include "lease.hpp"

namespace coord::lock {

/*
  Leases held by this process, indexed by owning thread for the hierarchy check.
*/
class LeaseTable {
 public:
  void Insert(const Lease& lease);

  void Remove(const std::string& lease_id);

  std::optional<Lease> Find(const std::string& lease_id) const;

  std::vector<Lease> HeldBy(std::thread::id thread) const;

  bool IsHeldBy(std::thread::id thread, const std::string& resource) const;

  size_t Size() const;

 private:
  mutable std::mutex mutex_;

  std::unordered_map<std::string, Lease>                 leases_;
  std::unordered_multimap<std::thread::id, std::string> by_thread_;
};

} // namespace coord::lock
