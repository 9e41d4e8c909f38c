#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace coord::audit {

struct AuditEvent {
  util::TimePoint timestamp;
  std::string     component; // lock | state | workspace-index | recovery | workspace
  std::string     action;
  std::string     resource;
  std::string     mode;
  int64_t         holder_pid  = 0;
  std::string     outcome;
  int64_t         duration_ms = 0;
  std::string     detail;
};

/*
  Append-only record of coordination events.

  Implementations must not throw from Record: an audit failure is logged and
  never fails the operation being audited.
*/
class AuditTrail {
 public:
  virtual ~AuditTrail() = default;

  virtual void Record(const AuditEvent& event) = 0;

  // Newest first. Empty component means all.
  virtual std::vector<AuditEvent> Recent(size_t limit, const std::string& component = {}) = 0;
};

class NullAuditTrail final : public AuditTrail {
 public:
  void Record(const AuditEvent&) override {
  }
  std::vector<AuditEvent> Recent(size_t, const std::string&) override {
    return {};
  }
};

} // namespace coord::audit
