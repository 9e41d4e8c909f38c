#include "lock_hierarchy.hpp"

#include <algorithm>
#include <set>

#include "internal/util/errors.hpp"

namespace coord::lock {

LockHierarchy::LockHierarchy(std::map<std::string, int> priorities) : priorities_(std::move(priorities)) {
}

int LockHierarchy::PriorityOf(const std::string& resource) const {
  if (auto it = priorities_.find(resource); it != priorities_.end()) {
    return it->second;
  }
  if (resource.rfind("user:", 0) == 0) {
    return kUserPriority;
  }
  return kDefaultPriority;
}

std::vector<std::string> LockHierarchy::Sort(const std::vector<std::string>& resources) const {
  std::set<std::string>    seen;
  std::vector<std::string> out;
  for (const auto& resource : resources) {
    if (seen.insert(resource).second) out.push_back(resource);
  }
  std::stable_sort(out.begin(), out.end(), [this](const std::string& a, const std::string& b) {
    const auto pa = PriorityOf(a);
    const auto pb = PriorityOf(b);
    return pa != pb ? pa < pb : a < b;
  });
  return out;
}

void LockHierarchy::CheckOrder(const std::vector<Lease>& held, const std::string& resource) const {
  const auto wanted = PriorityOf(resource);
  for (const auto& lease : held) {
    const auto have = PriorityOf(lease.resource);
    if (wanted < have) {
      throw util::ConfigurationError("lock order violation: cannot acquire '" + resource + "' (priority " + std::to_string(wanted) +
                                     ") while holding '" + lease.resource + "' (priority " + std::to_string(have) + ")");
    }
  }
}

} // namespace coord::lock
