#include "internal/lock/lock_hierarchy.hpp"

#include <cassert>
#include <iostream>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using coord::lock::Lease;
using coord::lock::LockHierarchy;

LockHierarchy MakeHierarchy() {
  return LockHierarchy({{"trunk", 5}, {"state", 10}, {"workspace-index", 20}, {"temp", 60}});
}

Lease Held(const std::string& resource) {
  Lease lease;
  lease.lease_id     = "lease-" + resource;
  lease.resource     = resource;
  lease.owner_thread = std::this_thread::get_id();
  return lease;
}

void TestPriorityLookup() {
  const auto hierarchy = MakeHierarchy();
  assert(hierarchy.PriorityOf("trunk") == 5);
  assert(hierarchy.PriorityOf("temp") == 60);
  assert(hierarchy.PriorityOf("user:deploy") == LockHierarchy::kUserPriority);
  assert(hierarchy.PriorityOf("anything-else") == LockHierarchy::kDefaultPriority);
}

void TestSortIsAscendingAndDeduplicated() {
  const auto hierarchy = MakeHierarchy();
  const auto sorted    = hierarchy.Sort({"zeta", "workspace-index", "user:b", "state", "trunk", "user:a", "state", "alpha"});

  const std::vector<std::string> expected = {"trunk", "state", "workspace-index", "user:a", "user:b", "alpha", "zeta"};
  assert(sorted == expected);
}

void TestAscendingAcquisitionIsAllowed() {
  const auto hierarchy = MakeHierarchy();
  hierarchy.CheckOrder({}, "workspace-index");
  hierarchy.CheckOrder({Held("trunk")}, "state");
  hierarchy.CheckOrder({Held("trunk"), Held("state")}, "workspace-index");
  // Same priority is not an inversion.
  hierarchy.CheckOrder({Held("user:a")}, "user:b");
}

void TestInversionIsRejected() {
  const auto hierarchy = MakeHierarchy();

  bool threw = false;
  try {
    hierarchy.CheckOrder({Held("workspace-index")}, "state");
  } catch (const coord::util::ConfigurationError& e) {
    threw = true;
    const std::string message = e.what();
    assert(message.find("state") != std::string::npos);
    assert(message.find("workspace-index") != std::string::npos);
  }
  assert(threw);
}

} // namespace

int main() {
  TestPriorityLookup();
  TestSortIsAscendingAndDeduplicated();
  TestAscendingAcquisitionIsAllowed();
  TestInversionIsRejected();

  std::cout << "coord_unit_lock_hierarchy: pass\n";
  return 0;
}
