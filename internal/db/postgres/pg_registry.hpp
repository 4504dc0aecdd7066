#pragma once

#include <memory>

#include "internal/db/api/event_registry.hpp"
#include "pg_pool.hpp"

namespace eventstore::db::postgres {

/*
  Postgres registry.

  Writes take a per-entity advisory lock for the version read, and
  UNIQUE(entity_type_name, entity_id, version) backs it up: a racing insert
  surfaces as unique_violation, reported as Conflict.
*/
class PgRegistry final : public db::EventRegistry {
public:
  explicit PgRegistry(std::shared_ptr<PgPool> pool);

  static void BootstrapSchema(PgPool& pool);

  std::vector<model::EventEnvelope> Query(const EventFilter& filter) override;
  std::optional<model::EntitySnapshotEnvelope> QueryLatestSnapshot(const SnapshotFilter& filter) override;
  Result Store(const RegistryRecord& record) override;

private:
  Result StoreEvent(pqxx::work& tx, const model::EventEnvelope& event);
  Result StoreSnapshot(pqxx::work& tx, const model::EntitySnapshotEnvelope& snapshot);

  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

}
