#pragma once

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace eventstore::db::sqlite {

// sqlite failure carrying the (extended) result code.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int Code() const noexcept {
    return code_;
  }

 private:
  int code_;
};

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (pragmas, schema, BEGIN/COMMIT)
  void Exec(const std::string& sql);

  // Prepared statement, finalized when the handle goes out of scope
  Statement Prepare(const std::string& sql);

 private:
  // WAL, foreign keys, busy timeout
  void Configure(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace eventstore::db::sqlite
