#include "pg_pool.hpp"

namespace eventstore::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("query_events",
               "SELECT entity_type_name, entity_id, version, type_name, super_kind, value, request_id, "
               "current_user_json, created_at, persisted_at "
               "FROM events WHERE entity_type_name=$1 AND entity_id=$2 AND ($3::text IS NULL OR created_at>$3) "
               "ORDER BY created_at ASC, version ASC");

  conn.prepare("latest_snapshot",
               "SELECT entity_type_name, entity_id, version, type_name, value, request_id, created_at, "
               "snapshotted_event_created_at, persisted_at "
               "FROM snapshots WHERE entity_type_name=$1 AND entity_id=$2 "
               "ORDER BY created_at DESC, seq DESC LIMIT 1");

  conn.prepare("lock_entity", "SELECT pg_advisory_xact_lock(hashtext($1 || '/' || $2))");

  conn.prepare("last_event",
               "SELECT version, created_at FROM events WHERE entity_type_name=$1 AND entity_id=$2 "
               "ORDER BY version DESC LIMIT 1");

  conn.prepare("last_snapshot_version",
               "SELECT COALESCE(MAX(version),0) FROM snapshots WHERE entity_type_name=$1 AND entity_id=$2");

  conn.prepare("insert_event",
               "INSERT INTO events(entity_type_name, entity_id, version, type_name, super_kind, value, request_id, "
               "current_user_json, created_at, persisted_at) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");

  conn.prepare("insert_snapshot",
               "INSERT INTO snapshots(entity_type_name, entity_id, version, type_name, value, request_id, created_at, "
               "snapshotted_event_created_at, persisted_at) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace eventstore::db::postgres
