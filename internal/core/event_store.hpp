#pragma once

#include <spdlog/logger.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/event_dispatcher.hpp"
#include "internal/db/api/event_registry.hpp"
#include "internal/model/event_envelope.hpp"
#include "internal/model/snapshot_envelope.hpp"
#include "internal/retry/retry_policy.hpp"

namespace eventstore::core {

/*
  Explicit per-store context.

  clock produces canonical timestamps for persisted_at; sleep is the
  backoff wait. Both are replaceable so tests never touch wall time.
*/
struct EventStoreContext {
  retry::RetryOptions             retry;
  std::shared_ptr<spdlog::logger> logger;
  retry::Sleeper                  sleep = retry::SleepFor;
  std::function<std::string()>    clock;
};

// Replay input: latest snapshot (if any) plus every event after it.
struct EntityHistory {
  std::optional<model::EntitySnapshotEnvelope> snapshot;
  std::vector<model::EventEnvelope>            events;
};

/*
  EventStore

  Orchestrates reads and appends against an EventRegistry. Holds no state
  between calls besides its registry handle and context; the registry's
  store-time version check is the only serialization mechanism.
*/
class EventStore {
 public:
  EventStore(std::shared_ptr<db::EventRegistry> registry, EventStoreContext context);

  // Events with created_at strictly after since (origin of time when unset),
  // ascending. since may be any RFC 3339 timestamp; an unparseable one throws
  // std::invalid_argument. Registry errors propagate unchanged.
  std::vector<model::EventEnvelope> ReadEntityEventsSince(const std::string& entity_type_name, const std::string& entity_id,
                                                          const std::optional<std::string>& since = std::nullopt) const;

  // nullopt means "replay from origin", not an error.
  std::optional<model::EntitySnapshotEnvelope> ReadEntityLatestSnapshot(const std::string& entity_type_name,
                                                                        const std::string& entity_id) const;

  // A versioned snapshot resumes after its version; an unversioned one after
  // snapshotted_event_created_at.
  EntityHistory ReadEntityHistory(const std::string& entity_type_name, const std::string& entity_id) const;

  /*
    Persists envelopes one at a time, in order, each under the conflict
    retry policy, then hands the whole batch to dispatcher exactly once.

    Throws:
      ConflictError  - an envelope exhausted its retries
      RegistryError  - non-conflict storage failure (no retry)
      DispatchError  - batch stored, dispatch failed
      std::invalid_argument - a created_at is not a timestamp (nothing stored)

    Envelopes stored before a failure stay stored; later ones are not tried.
  */
  void StoreEvents(const std::vector<model::NonPersistedEventEnvelope>& envelopes, EventDispatcher& dispatcher);

  // Same retry policy as StoreEvents, no dispatch. Timestamps are
  // canonicalized first; an unparseable one throws std::invalid_argument.
  void StoreSnapshot(const model::EntitySnapshotEnvelope& snapshot);

 private:
  std::vector<model::EventEnvelope> QueryEvents(const std::string& entity_type_name, const std::string& entity_id,
                                                const std::string& created_after) const;
  void PersistEvent(const model::NonPersistedEventEnvelope& envelope);
  void PersistSnapshot(const model::EntitySnapshotEnvelope& snapshot);
  std::string CurrentTime() const;

  std::shared_ptr<db::EventRegistry> registry_;
  EventStoreContext                  context_;
};

} // namespace eventstore::core
