#pragma once

#include <mutex>

#include "audit_trail.hpp"

namespace coord::audit {

/*
  In-memory audit trail used by tests.
*/
class MemoryAuditTrail final : public AuditTrail {
 public:
  void Record(const AuditEvent& event) override;

  std::vector<AuditEvent> Recent(size_t limit, const std::string& component = {}) override;

  size_t Count(const std::string& action) const;

 private:
  mutable std::mutex      mutex_;
  std::vector<AuditEvent> events_;
};

} // namespace coord::audit
