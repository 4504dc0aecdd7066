#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/event_registry.hpp"
#include "sqlite_db.hpp"

namespace eventstore::db::sqlite {

/*
  Durable registry on a single SQLite file.

  events.version is UNIQUE per entity; the expected-version check runs
  inside BEGIN IMMEDIATE so it cannot interleave with another writer.
*/
class SqliteRegistry final : public db::EventRegistry {
public:
  explicit SqliteRegistry(std::shared_ptr<SqliteDB> db);

  // CREATE TABLE IF NOT EXISTS for events/snapshots + indexes
  static void BootstrapSchema(SqliteDB& db);

  std::vector<model::EventEnvelope> Query(const EventFilter& filter) override;
  std::optional<model::EntitySnapshotEnvelope> QueryLatestSnapshot(const SnapshotFilter& filter) override;
  Result Store(const RegistryRecord& record) override;

private:
  Result StoreEvent(const model::EventEnvelope& event);
  Result StoreSnapshot(const model::EntitySnapshotEnvelope& snapshot);

  static Result Translate(int code, const std::string& message);

  std::shared_ptr<SqliteDB> db_;

  // single connection: calls take turns so a reader never sees an open write
  std::mutex mutex_;
};

}
