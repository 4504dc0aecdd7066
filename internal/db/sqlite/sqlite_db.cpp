#include "sqlite_db.hpp"

#include <utility>

namespace eventstore::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw SqliteError(sqlite3_extended_errcode(db), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, "sqlite open " + path_ + ": " + msg);
  }

  sqlite3_extended_result_codes(db_, 1);
  Configure(busy_timeout_ms);
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
    throw SqliteError(rc, msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  Statement     owned(stmt);
  ThrowIf(rc, db_, "sqlite prepare");
  return owned;
}

void SqliteDB::Configure(int busy_timeout_ms) {
  // WAL lets readers proceed while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");

  // an appended event must survive power loss once Store returns
  Exec("PRAGMA synchronous=FULL;");

  Exec("PRAGMA foreign_keys=ON;");

  // wait for the write lock instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace eventstore::db::sqlite
