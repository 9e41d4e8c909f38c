#pragma once

#include <map>
#include <string>
#include <vector>

#include "lease.hpp"

namespace coord::lock {

/*
  Priority table that fixes a global acquisition order.

  Lower number = acquired earlier. A thread may take a resource only if its
  priority is not lower than every resource it already holds; acquiring in
  ascending order everywhere rules out lock cycles.
*/
class LockHierarchy {
 public:
  static constexpr int kUserPriority    = 100;
  static constexpr int kDefaultPriority = 999;

  explicit LockHierarchy(std::map<std::string, int> priorities);

  int PriorityOf(const std::string& resource) const;

  // Stable ascending by priority, then by name. Duplicates removed.
  std::vector<std::string> Sort(const std::vector<std::string>& resources) const;

  // Throws ConfigurationError naming both resources on an out-of-order request.
  void CheckOrder(const std::vector<Lease>& held, const std::string& resource) const;

 private:
  std::map<std::string, int> priorities_;
};

} // namespace coord::lock
