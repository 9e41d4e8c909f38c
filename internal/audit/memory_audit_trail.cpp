#include "memory_audit_trail.hpp"

namespace coord::audit {

void MemoryAuditTrail::Record(const AuditEvent& event) {
  std::lock_guard lock(mutex_);
  events_.push_back(event);
}

std::vector<AuditEvent> MemoryAuditTrail::Recent(size_t limit, const std::string& component) {
  std::lock_guard lock(mutex_);

  std::vector<AuditEvent> out;
  for (auto it = events_.rbegin(); it != events_.rend() && out.size() < limit; ++it) {
    if (!component.empty() && it->component != component) continue;
    out.push_back(*it);
  }
  return out;
}

size_t MemoryAuditTrail::Count(const std::string& action) const {
  std::lock_guard lock(mutex_);

  size_t count = 0;
  for (const auto& event : events_) {
    if (event.action == action) ++count;
  }
  return count;
}

} // namespace coord::audit
