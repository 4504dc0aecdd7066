#include "memory_registry.hpp"

namespace eventstore::db::memory {

MemoryRegistry::MemoryRegistry() = default;

std::vector<model::EventEnvelope> MemoryRegistry::Query(const EventFilter& filter) {
  std::vector<model::EventEnvelope> out;

  std::scoped_lock lock(mutex_);
  const auto       it = streams_.find({filter.entity_type_name, filter.entity_id});
  if (it == streams_.end()) {
    return out;
  }

  for (const auto& event : it->second.events) {
    if (filter.created_after.has_value() && !(event.created_at > *filter.created_after)) {
      continue;
    }
    out.push_back(event);
  }
  return out;
}

std::optional<model::EntitySnapshotEnvelope> MemoryRegistry::QueryLatestSnapshot(const SnapshotFilter& filter) {
  std::scoped_lock lock(mutex_);
  const auto       it = streams_.find({filter.entity_type_name, filter.entity_id});
  if (it == streams_.end()) {
    return std::nullopt;
  }
  return it->second.latest_snapshot;
}

Result MemoryRegistry::Store(const RegistryRecord& record) {
  if (const auto* event = std::get_if<model::EventEnvelope>(&record)) {
    return StoreEvent(*event);
  }
  return StoreSnapshot(std::get<model::EntitySnapshotEnvelope>(record));
}

Result MemoryRegistry::StoreEvent(const model::EventEnvelope& event) {
  std::scoped_lock lock(mutex_);
  auto&            stream = streams_[{event.entity_type_name, event.entity_id}];

  const auto expected = static_cast<std::uint64_t>(stream.events.size()) + 1;
  if (event.version.has_value() && *event.version != expected) {
    return Result::Err(ErrorCode::Conflict, "expected version " + std::to_string(expected) + ", got " +
                                                std::to_string(*event.version));
  }

  if (!stream.events.empty() && event.created_at < stream.events.back().created_at) {
    return Result::Err(ErrorCode::ConstraintViolation, "created_at " + event.created_at + " precedes last stored event at " +
                                                           stream.events.back().created_at);
  }

  auto stored    = event;
  stored.version = expected;
  stream.events.push_back(std::move(stored));
  return Result::Ok();
}

Result MemoryRegistry::StoreSnapshot(const model::EntitySnapshotEnvelope& snapshot) {
  std::scoped_lock lock(mutex_);
  auto&            stream = streams_[{snapshot.entity_type_name, snapshot.entity_id}];

  if (snapshot.version.has_value()) {
    if (stream.last_snapshot_version > *snapshot.version) {
      return Result::Err(ErrorCode::Conflict, "snapshot at version " + std::to_string(stream.last_snapshot_version) +
                                                  " already stored, got " + std::to_string(*snapshot.version));
    }
    stream.last_snapshot_version = *snapshot.version;
  }

  // ties on created_at go to the newer store
  if (!stream.latest_snapshot || snapshot.created_at >= stream.latest_snapshot->created_at) {
    stream.latest_snapshot = snapshot;
  }
  return Result::Ok();
}

} // namespace eventstore::db::memory
