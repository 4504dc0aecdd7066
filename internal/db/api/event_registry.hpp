#pragma once

#include <optional>
#include <variant>
#include <vector>

#include "internal/db/api/record_filter.hpp"
#include "internal/db/api/result.hpp"
#include "internal/model/event_envelope.hpp"
#include "internal/model/snapshot_envelope.hpp"

namespace eventstore::db {

using RegistryRecord = std::variant<model::EventEnvelope, model::EntitySnapshotEnvelope>;

/*
  Event registry abstraction.

  CRITICAL GUARANTEES:

  - Query returns events ordered ascending by created_at, with created_at
    strictly greater than the filter bound
  - Store writes exactly one record, atomically with its version check
  - A version check failure is reported as ErrorCode::Conflict and nothing
    else is
  - Stored events are never mutated or reordered

  Query failures (I/O, corrupt rows) are thrown as util::RegistryError.
*/

class EventRegistry {
 public:
  virtual ~EventRegistry() = default;

  virtual std::vector<model::EventEnvelope> Query(const EventFilter& filter) = 0;

  virtual std::optional<model::EntitySnapshotEnvelope> QueryLatestSnapshot(const SnapshotFilter& filter) = 0;

  virtual Result Store(const RegistryRecord& record) = 0;
};

} // namespace eventstore::db
