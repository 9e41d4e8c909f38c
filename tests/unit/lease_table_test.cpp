#include "internal/lock/lease_table.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using coord::lock::Lease;
using coord::lock::LeaseTable;

Lease MakeLease(const std::string& lease_id, const std::string& resource, std::thread::id owner) {
  Lease lease;
  lease.lease_id     = lease_id;
  lease.resource     = resource;
  lease.holder_pid   = 42;
  lease.acquired_at  = std::chrono::system_clock::now();
  lease.expires_at   = lease.acquired_at + std::chrono::seconds(30);
  lease.owner_thread = owner;
  return lease;
}

void TestLeasesAreTrackedPerThread() {
  LeaseTable table;
  const auto self = std::this_thread::get_id();

  std::thread::id other;
  std::thread([&] { other = std::this_thread::get_id(); }).join();

  table.Insert(MakeLease("lease-a", "state", self));
  table.Insert(MakeLease("lease-b", "trunk", self));
  table.Insert(MakeLease("lease-c", "state", other));

  assert(table.Size() == 3);
  assert(table.HeldBy(self).size() == 2);
  assert(table.HeldBy(other).size() == 1);
  assert(table.IsHeldBy(self, "trunk"));
  assert(!table.IsHeldBy(other, "trunk"));
}

void TestRemoveDropsThreadIndexEntry() {
  LeaseTable table;
  const auto self = std::this_thread::get_id();

  table.Insert(MakeLease("lease-a", "state", self));
  assert(table.Find("lease-a").has_value());

  table.Remove("lease-a");
  assert(!table.Find("lease-a").has_value());
  assert(table.HeldBy(self).empty());
  assert(!table.IsHeldBy(self, "state"));

  // Unknown ids are ignored.
  table.Remove("lease-missing");
  assert(table.Size() == 0);
}

void TestReinsertReplacesLease() {
  LeaseTable table;
  const auto self = std::this_thread::get_id();

  table.Insert(MakeLease("lease-a", "state", self));
  table.Insert(MakeLease("lease-a", "state", self));

  assert(table.Size() == 1);
  assert(table.HeldBy(self).size() == 1);
}

} // namespace

int main() {
  TestLeasesAreTrackedPerThread();
  TestRemoveDropsThreadIndexEntry();
  TestReinsertReplacesLease();

  std::cout << "coord_unit_lease_table: pass\n";
  return 0;
}
