#include "factory.hpp"

#include <stdexcept>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_registry.hpp"
#if EVENTSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_registry.hpp"
#endif
#if EVENTSTORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_registry.hpp"
#endif

namespace eventstore::factory {

using eventstore::runtime::config::RuntimeConfig;

std::shared_ptr<db::EventRegistry> BuildRegistry(const RuntimeConfig& config) {
  const auto& registry = config.registry();

  if (registry.has_sqlite()) {
#if EVENTSTORE_DB_SQLITE
    const auto& sqlite = registry.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("Invalid configuration: registry.sqlite.path is required");
    }
    auto sqlite_db = sqlite.busy_timeout_ms() > 0
                         ? std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), static_cast<int>(sqlite.busy_timeout_ms()))
                         : std::make_shared<db::sqlite::SqliteDB>(sqlite.path());
    return std::make_shared<db::sqlite::SqliteRegistry>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (registry.has_postgres()) {
#if EVENTSTORE_DB_POSTGRES
    const auto& postgres = registry.postgres();
    auto        pool     = postgres.max_connections() > 0
                               ? std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections())
                               : std::make_shared<db::postgres::PgPool>(postgres.connection_uri());
    db::postgres::PgRegistry::BootstrapSchema(*pool);
    return std::make_shared<db::postgres::PgRegistry>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRegistry>();
}

std::unique_ptr<core::EventStore> BuildEventStore(const RuntimeConfig& config, std::shared_ptr<spdlog::logger> logger) {
  core::EventStoreContext context;
  context.retry  = config::ToRetryOptions(config.retry());
  context.logger = std::move(logger);

  return std::make_unique<core::EventStore>(BuildRegistry(config), std::move(context));
}

} // namespace eventstore::factory
