#include "pg_registry.hpp"

#include "internal/util/errors.hpp"

namespace eventstore::db::postgres {

namespace {

std::optional<uint64_t> OptionalU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

} // namespace

PgRegistry::PgRegistry(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRegistry::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS events (seq BIGSERIAL PRIMARY KEY, entity_type_name TEXT NOT NULL, entity_id TEXT NOT NULL, "
          "version BIGINT NOT NULL, type_name TEXT NOT NULL, super_kind TEXT NOT NULL, value TEXT NOT NULL, request_id TEXT, "
          "current_user_json TEXT, created_at TEXT NOT NULL, persisted_at TEXT NOT NULL, "
          "UNIQUE(entity_type_name, entity_id, version));");
  tx.exec("CREATE INDEX IF NOT EXISTS events_by_entity_time ON events(entity_type_name, entity_id, created_at);");
  tx.exec("CREATE TABLE IF NOT EXISTS snapshots (seq BIGSERIAL PRIMARY KEY, entity_type_name TEXT NOT NULL, entity_id TEXT NOT NULL, "
          "version BIGINT, type_name TEXT NOT NULL, value TEXT NOT NULL, request_id TEXT, created_at TEXT NOT NULL, "
          "snapshotted_event_created_at TEXT, persisted_at TEXT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS snapshots_by_entity_time ON snapshots(entity_type_name, entity_id, created_at);");
  tx.commit();
}

Result PgRegistry::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::vector<model::EventEnvelope> PgRegistry::Query(const EventFilter& filter) {
  std::vector<model::EventEnvelope> out;
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("query_events", filter.entity_type_name, filter.entity_id, filter.created_after);

    out.reserve(res.size());
    for (const auto& row : res) {
      model::EventEnvelope e;
      e.entity_type_name = row[0].c_str();
      e.entity_id        = row[1].c_str();
      e.version          = OptionalU64(row[2]);
      e.type_name        = row[3].c_str();
      e.super_kind       = row[4].c_str();
      e.value            = row[5].c_str();
      e.request_id       = Text(row[6]);
      e.current_user     = Text(row[7]);
      e.created_at       = row[8].c_str();
      e.persisted_at     = row[9].c_str();
      out.push_back(std::move(e));
    }
    tx.commit();
  } catch (const std::exception& e) {
    util::ThrowIfRegistryError(Translate(e), "postgres query events");
  }
  return out;
}

std::optional<model::EntitySnapshotEnvelope> PgRegistry::QueryLatestSnapshot(const SnapshotFilter& filter) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("latest_snapshot", filter.entity_type_name, filter.entity_id);
    tx.commit();
    if (res.empty()) {
      return std::nullopt;
    }

    const auto&                   row = res[0];
    model::EntitySnapshotEnvelope s;
    s.entity_type_name             = row[0].c_str();
    s.entity_id                    = row[1].c_str();
    s.version                      = OptionalU64(row[2]);
    s.type_name                    = row[3].c_str();
    s.value                        = row[4].c_str();
    s.request_id                   = Text(row[5]);
    s.created_at                   = row[6].c_str();
    s.snapshotted_event_created_at = Text(row[7]);
    s.persisted_at                 = row[8].c_str();
    return s;
  } catch (const std::exception& e) {
    util::ThrowIfRegistryError(Translate(e), "postgres query latest snapshot");
  }
  return std::nullopt;
}

Result PgRegistry::Store(const RegistryRecord& record) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);

    Result result;
    if (const auto* event = std::get_if<model::EventEnvelope>(&record)) {
      result = StoreEvent(tx, *event);
    } else {
      result = StoreSnapshot(tx, std::get<model::EntitySnapshotEnvelope>(record));
    }

    if (result) {
      tx.commit();
    }
    return result;
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRegistry::StoreEvent(pqxx::work& tx, const model::EventEnvelope& event) {
  tx.exec_prepared("lock_entity", event.entity_type_name, event.entity_id);

  const auto last     = tx.exec_prepared("last_event", event.entity_type_name, event.entity_id);
  const auto expected = last.empty() ? uint64_t{1} : last[0][0].as<uint64_t>() + 1;
  if (event.version.has_value() && *event.version != expected) {
    return Result::Err(ErrorCode::Conflict, "expected version " + std::to_string(expected) + ", got " + std::to_string(*event.version));
  }

  if (!last.empty() && event.created_at < std::string(last[0][1].c_str())) {
    return Result::Err(ErrorCode::ConstraintViolation,
                       "created_at " + event.created_at + " precedes last stored event at " + last[0][1].c_str());
  }

  tx.exec_prepared("insert_event", event.entity_type_name, event.entity_id, expected, event.type_name, event.super_kind, event.value,
                   event.request_id, event.current_user, event.created_at, event.persisted_at);
  return Result::Ok();
}

Result PgRegistry::StoreSnapshot(pqxx::work& tx, const model::EntitySnapshotEnvelope& snapshot) {
  tx.exec_prepared("lock_entity", snapshot.entity_type_name, snapshot.entity_id);

  if (snapshot.version.has_value()) {
    const auto last =
        tx.exec_prepared("last_snapshot_version", snapshot.entity_type_name, snapshot.entity_id)[0][0].as<uint64_t>();
    if (last > *snapshot.version) {
      return Result::Err(ErrorCode::Conflict, "snapshot at version " + std::to_string(last) + " already stored, got " +
                                                  std::to_string(*snapshot.version));
    }
  }

  tx.exec_prepared("insert_snapshot", snapshot.entity_type_name, snapshot.entity_id, snapshot.version, snapshot.type_name,
                   snapshot.value, snapshot.request_id, snapshot.created_at, snapshot.snapshotted_event_created_at,
                   snapshot.persisted_at);
  return Result::Ok();
}

} // namespace eventstore::db::postgres
