#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/event_registry.hpp"

namespace eventstore::db::memory {

/*
  In-process registry.

  One mutex guards everything, so the version and created_at checks and the
  append are a single atomic step. Only the latest snapshot per entity is
  kept. Not durable; used for tests and embedding.
*/
class MemoryRegistry final : public db::EventRegistry {
 public:
  MemoryRegistry();

  std::vector<model::EventEnvelope> Query(const EventFilter& filter) override;
  std::optional<model::EntitySnapshotEnvelope> QueryLatestSnapshot(const SnapshotFilter& filter) override;
  Result Store(const RegistryRecord& record) override;

 private:
  using EntityKey = std::pair<std::string, std::string>; // (entity_type_name, entity_id)

  // events are kept in version order, which is also created_at order
  struct EntityStream {
    std::vector<model::EventEnvelope>            events;
    std::optional<model::EntitySnapshotEnvelope> latest_snapshot;
    std::uint64_t                                last_snapshot_version = 0;
  };

  Result StoreEvent(const model::EventEnvelope& event);
  Result StoreSnapshot(const model::EntitySnapshotEnvelope& snapshot);

  std::mutex                          mutex_;
  std::map<EntityKey, EntityStream>   streams_;
};

} // namespace eventstore::db::memory
