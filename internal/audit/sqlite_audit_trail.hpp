#pragma once

#include <memory>
#include <mutex>

#include "audit_trail.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace coord::audit {

/*
  SQLite-backed audit trail shared by every coordctl process on the host.

  WAL mode plus busy timeout lets concurrent processes append without
  coordinating through the lock manager.
*/
class SqliteAuditTrail final : public AuditTrail {
 public:
  explicit SqliteAuditTrail(std::shared_ptr<db::sqlite::SqliteDB> db);

  void Record(const AuditEvent& event) override;

  std::vector<AuditEvent> Recent(size_t limit, const std::string& component = {}) override;

 private:
  void Migrate();

  std::mutex                            mutex_;
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace coord::audit
