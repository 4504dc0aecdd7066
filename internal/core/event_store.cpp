#include "event_store.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace eventstore::core {

using observability::IntField;
using observability::StringField;

namespace {

std::string RequireTimestamp(const std::string& text, const char* field) {
  auto canonical = util::Canonicalize(text);
  if (!canonical) {
    throw std::invalid_argument(std::string(field) + " is not an RFC 3339 timestamp: '" + text + "'");
  }
  return *canonical;
}

} // namespace

EventStore::EventStore(std::shared_ptr<db::EventRegistry> registry, EventStoreContext context)
    : registry_(std::move(registry)), context_(std::move(context)) {
  if (!registry_) {
    throw std::invalid_argument("EventStore requires an event registry");
  }
  if (!context_.logger) {
    context_.logger = observability::NullLogger();
  }
  if (!context_.clock) {
    context_.clock = util::NowIso8601;
  }
}

std::string EventStore::CurrentTime() const {
  return context_.clock();
}

std::vector<model::EventEnvelope> EventStore::ReadEntityEventsSince(const std::string& entity_type_name, const std::string& entity_id,
                                                                    const std::optional<std::string>& since) const {
  const auto created_after = (since && !since->empty()) ? RequireTimestamp(*since, "since") : std::string(util::kOriginOfTime);
  return QueryEvents(entity_type_name, entity_id, created_after);
}

std::vector<model::EventEnvelope> EventStore::QueryEvents(const std::string& entity_type_name, const std::string& entity_id,
                                                          const std::string& created_after) const {
  db::EventFilter filter;
  filter.entity_type_name = entity_type_name;
  filter.entity_id        = entity_id;
  filter.created_after    = created_after;

  auto events = registry_->Query(filter);

  EVENTSTORE_LOG_DEBUG(*context_.logger, "loaded entity events",
                       {StringField("kind", model::ToString(db::EventFilter::Kind())), StringField("entity_type_name", entity_type_name),
                        StringField("entity_id", entity_id), StringField("since", created_after),
                        IntField("count", static_cast<std::int64_t>(events.size()))});
  return events;
}

std::optional<model::EntitySnapshotEnvelope> EventStore::ReadEntityLatestSnapshot(const std::string& entity_type_name,
                                                                                  const std::string& entity_id) const {
  db::SnapshotFilter filter;
  filter.entity_type_name = entity_type_name;
  filter.entity_id        = entity_id;

  auto snapshot = registry_->QueryLatestSnapshot(filter);

  if (snapshot) {
    EVENTSTORE_LOG_DEBUG(*context_.logger, "snapshot found",
                         {StringField("entity_type_name", entity_type_name), StringField("entity_id", entity_id),
                          StringField("created_at", snapshot->created_at),
                          StringField("snapshotted_event_created_at", snapshot->snapshotted_event_created_at)});
  } else {
    EVENTSTORE_LOG_DEBUG(*context_.logger, "no snapshot found",
                         {StringField("kind", model::ToString(db::SnapshotFilter::Kind())),
                          StringField("entity_type_name", entity_type_name), StringField("entity_id", entity_id)});
  }
  return snapshot;
}

EntityHistory EventStore::ReadEntityHistory(const std::string& entity_type_name, const std::string& entity_id) const {
  EntityHistory history;
  history.snapshot = ReadEntityLatestSnapshot(entity_type_name, entity_id);

  if (!history.snapshot) {
    history.events = ReadEntityEventsSince(entity_type_name, entity_id);
    return history;
  }

  const auto& folded_at = history.snapshot->snapshotted_event_created_at;
  if (!history.snapshot->version) {
    history.events = ReadEntityEventsSince(entity_type_name, entity_id, folded_at);
    return history;
  }

  // events sharing the folded event's created_at may come after it; the
  // version decides, so the time bound has to include that instant
  const auto  folded_version = *history.snapshot->version;
  const auto  folded_time    = util::ParseIso8601(folded_at);
  std::string created_after  = folded_time ? util::ToIso8601(*folded_time - std::chrono::milliseconds(1))
                                           : std::string(util::kOriginOfTime);

  history.events = QueryEvents(entity_type_name, entity_id, created_after);
  std::erase_if(history.events,
                [folded_version](const model::EventEnvelope& e) { return e.version && *e.version <= folded_version; });
  return history;
}

void EventStore::StoreEvents(const std::vector<model::NonPersistedEventEnvelope>& envelopes, EventDispatcher& dispatcher) {
  // validated up front so a bad timestamp stores nothing
  std::vector<model::NonPersistedEventEnvelope> canonical = envelopes;
  for (auto& envelope : canonical) {
    envelope.created_at = RequireTimestamp(envelope.created_at, "created_at");
  }

  EVENTSTORE_LOG_DEBUG(*context_.logger, "storing event envelopes", {IntField("count", static_cast<std::int64_t>(envelopes.size()))});

  std::size_t stored = 0;
  try {
    for (const auto& envelope : canonical) {
      retry::RetryIfError([&] { PersistEvent(envelope); }, util::ErrorKind::kConflict, context_.retry, context_.sleep, *context_.logger);
      ++stored;
    }
  } catch (const util::EventStoreError& e) {
    const auto& failed = envelopes[stored];
    EVENTSTORE_LOG_ERROR(*context_.logger, "event batch store failed",
                         {StringField("kind", util::ToString(e.Kind())), StringField("entity_type_name", failed.entity_type_name),
                          StringField("entity_id", failed.entity_id), IntField("stored", static_cast<std::int64_t>(stored)),
                          IntField("total", static_cast<std::int64_t>(envelopes.size())), StringField("error", e.what())});
    throw;
  }

  EVENTSTORE_LOG_DEBUG(*context_.logger, "event envelopes stored", {IntField("count", static_cast<std::int64_t>(stored))});

  try {
    dispatcher.Dispatch(envelopes);
  } catch (const util::DispatchError&) {
    throw;
  } catch (const std::exception& e) {
    EVENTSTORE_LOG_ERROR(*context_.logger, "dispatch failed after persist",
                         {IntField("count", static_cast<std::int64_t>(envelopes.size())), StringField("error", e.what())});
    throw util::DispatchError(std::string("events persisted but not dispatched: ") + e.what());
  }
}

void EventStore::StoreSnapshot(const model::EntitySnapshotEnvelope& envelope) {
  auto snapshot       = envelope;
  snapshot.created_at = RequireTimestamp(snapshot.created_at, "created_at");
  if (!snapshot.snapshotted_event_created_at.empty()) {
    snapshot.snapshotted_event_created_at = RequireTimestamp(snapshot.snapshotted_event_created_at, "snapshotted_event_created_at");
  }

  EVENTSTORE_LOG_DEBUG(*context_.logger, "storing snapshot envelope",
                       {StringField("entity_type_name", snapshot.entity_type_name), StringField("entity_id", snapshot.entity_id),
                        StringField("snapshotted_event_created_at", snapshot.snapshotted_event_created_at)});

  retry::RetryIfError([&] { PersistSnapshot(snapshot); }, util::ErrorKind::kConflict, context_.retry, context_.sleep, *context_.logger);

  EVENTSTORE_LOG_DEBUG(*context_.logger, "snapshot stored",
                       {StringField("entity_type_name", snapshot.entity_type_name), StringField("entity_id", snapshot.entity_id)});
}

void EventStore::PersistEvent(const model::NonPersistedEventEnvelope& envelope) {
  // stamped per attempt: persisted_at is the time of the write that succeeded
  auto persisted = model::EventEnvelope::Persist(envelope, CurrentTime());
  util::ThrowIfRegistryError(registry_->Store(persisted), "store event " + envelope.entity_type_name + "/" + envelope.entity_id);
}

void EventStore::PersistSnapshot(const model::EntitySnapshotEnvelope& snapshot) {
  auto persisted         = snapshot;
  persisted.persisted_at = CurrentTime();
  util::ThrowIfRegistryError(registry_->Store(persisted), "store snapshot " + snapshot.entity_type_name + "/" + snapshot.entity_id);
}

} // namespace eventstore::core
