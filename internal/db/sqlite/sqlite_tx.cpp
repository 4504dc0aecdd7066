#include "sqlite_tx.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace eventstore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    spdlog::warn("sqlite rollback failed: {}", e.what());
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

} // namespace eventstore::db::sqlite
