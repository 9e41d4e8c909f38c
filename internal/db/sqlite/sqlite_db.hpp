#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace coord::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize or wrap in Statement)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Finalizes on scope exit.
class Statement {
 public:
  Statement(SqliteDB& db, const std::string& sql) : db_(db), stmt_(db.Prepare(sql)) {
  }
  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* Get() const {
    return stmt_;
  }

  void BindText(int idx, const std::string& value);
  void BindInt64(int idx, int64_t value);

  // true while rows are produced; throws on error.
  bool Step();

  std::string ColumnText(int col) const;
  int64_t     ColumnInt64(int col) const;

 private:
  SqliteDB&     db_;
  sqlite3_stmt* stmt_;
};

} // namespace coord::db::sqlite
