#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace coord::db::sqlite {

using coord::util::CoordError;
using coord::util::ErrorKind;

static ErrorKind Translate(int rc) {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorKind::kTimeout;
    case SQLITE_FULL:
      return ErrorKind::kDiskFull;
    case SQLITE_PERM:
    case SQLITE_READONLY:
    case SQLITE_CANTOPEN:
      return ErrorKind::kPermissionDenied;
    case SQLITE_NOMEM:
      return ErrorKind::kResourceExhausted;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorKind::kStateCorruption;
    default:
      return ErrorKind::kUnknown;
  }
}

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw CoordError(Translate(rc), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw CoordError(Translate(rc), "sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw CoordError(Translate(rc), msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately; set first so the WAL switch itself waits
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  // WAL lets many coordctl processes append while others read
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA temp_store=MEMORY;");
}

void Statement::BindText(int idx, const std::string& value) {
  ThrowIf(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT), db_.Handle(), "sqlite bind");
}

void Statement::BindInt64(int idx, int64_t value) {
  ThrowIf(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)), db_.Handle(), "sqlite bind");
}

bool Statement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw CoordError(Translate(rc), std::string("sqlite step: ") + sqlite3_errmsg(db_.Handle()));
}

std::string Statement::ColumnText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t Statement::ColumnInt64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

} // namespace coord::db::sqlite
