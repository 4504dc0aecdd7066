#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace eventstore::db::sqlite {

/*
  SQLite write transaction.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock before the version read
    - so read-check-insert is atomic against other writers

  Rolls back on destruction unless committed.
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
};

} // namespace eventstore::db::sqlite
