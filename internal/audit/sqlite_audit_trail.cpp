#include "sqlite_audit_trail.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace coord::audit {

using db::sqlite::Statement;

static constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS audit_event (
  id          INTEGER PRIMARY KEY AUTOINCREMENT,
  ts_ms       INTEGER NOT NULL,
  component   TEXT    NOT NULL,
  action      TEXT    NOT NULL,
  resource    TEXT    NOT NULL DEFAULT '',
  mode        TEXT    NOT NULL DEFAULT '',
  holder_pid  INTEGER NOT NULL DEFAULT 0,
  outcome     TEXT    NOT NULL DEFAULT '',
  duration_ms INTEGER NOT NULL DEFAULT 0,
  detail      TEXT    NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS audit_event_resource ON audit_event(resource, ts_ms);
)sql";

SqliteAuditTrail::SqliteAuditTrail(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  Migrate();
}

void SqliteAuditTrail::Migrate() {
  db_->Exec(kSchema);
}

void SqliteAuditTrail::Record(const AuditEvent& event) {
  std::lock_guard lock(mutex_);
  try {
    Statement st(*db_,
                 "INSERT INTO audit_event(ts_ms,component,action,resource,mode,holder_pid,outcome,duration_ms,detail) "
                 "VALUES(?,?,?,?,?,?,?,?,?);");
    st.BindInt64(1, static_cast<int64_t>(util::ToUnixMillis(event.timestamp)));
    st.BindText(2, event.component);
    st.BindText(3, event.action);
    st.BindText(4, event.resource);
    st.BindText(5, event.mode);
    st.BindInt64(6, event.holder_pid);
    st.BindText(7, event.outcome);
    st.BindInt64(8, event.duration_ms);
    st.BindText(9, event.detail);
    st.Step();
  } catch (const util::CoordError& e) {
    COORD_LOG_WARN("audit append failed",
                   {observability::StringField("action", event.action), observability::StringField("resource", event.resource),
                    observability::StringField("error", e.what())});
  }
}

std::vector<AuditEvent> SqliteAuditTrail::Recent(size_t limit, const std::string& component) {
  std::lock_guard lock(mutex_);

  Statement st(*db_,
               "SELECT ts_ms,component,action,resource,mode,holder_pid,outcome,duration_ms,detail FROM audit_event "
               "WHERE (?1 = '' OR component = ?1) ORDER BY id DESC LIMIT ?2;");
  st.BindText(1, component);
  st.BindInt64(2, static_cast<int64_t>(limit));

  std::vector<AuditEvent> out;
  while (st.Step()) {
    AuditEvent event;
    event.timestamp   = util::TimePoint(std::chrono::milliseconds(st.ColumnInt64(0)));
    event.component   = st.ColumnText(1);
    event.action      = st.ColumnText(2);
    event.resource    = st.ColumnText(3);
    event.mode        = st.ColumnText(4);
    event.holder_pid  = st.ColumnInt64(5);
    event.outcome     = st.ColumnText(6);
    event.duration_ms = st.ColumnInt64(7);
    event.detail      = st.ColumnText(8);
    out.push_back(std::move(event));
  }
  return out;
}

} // namespace coord::audit
