#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "internal/model/envelope_kind.hpp"

namespace eventstore::model {

/*
  Event that has been produced but not yet durably stored.

  Timestamps are canonical UTC ISO-8601 strings
  (YYYY-MM-DDTHH:MM:SS.mmmZ), fixed width so that lexical order
  equals time order.
*/
struct NonPersistedEventEnvelope {
  static constexpr EnvelopeKind kKind = EnvelopeKind::kEvent;

  std::string entity_type_name;
  std::string entity_id;

  // domain event type, e.g. "OrderPlaced"
  std::string type_name;
  std::string super_kind = "domain";

  // opaque JSON payload
  std::string value;

  std::string request_id;
  std::string current_user;

  std::string created_at;

  // Expected 1-based position in the entity stream.
  // Unset = append at whatever position is next.
  std::optional<std::uint64_t> version;
};

/*
  Durably stored event.

  The only way to obtain one from a NonPersistedEventEnvelope is Persist(),
  which stamps persisted_at.
*/
struct EventEnvelope : NonPersistedEventEnvelope {
  std::string persisted_at;

  static EventEnvelope Persist(const NonPersistedEventEnvelope& envelope, std::string persisted_at) {
    EventEnvelope persisted;
    static_cast<NonPersistedEventEnvelope&>(persisted) = envelope;
    persisted.persisted_at                             = std::move(persisted_at);
    return persisted;
  }
};

inline bool operator==(const NonPersistedEventEnvelope& a, const NonPersistedEventEnvelope& b) {
  return a.entity_type_name == b.entity_type_name && a.entity_id == b.entity_id && a.type_name == b.type_name &&
         a.super_kind == b.super_kind && a.value == b.value && a.request_id == b.request_id &&
         a.current_user == b.current_user && a.created_at == b.created_at && a.version == b.version;
}

inline bool operator==(const EventEnvelope& a, const EventEnvelope& b) {
  return static_cast<const NonPersistedEventEnvelope&>(a) == static_cast<const NonPersistedEventEnvelope&>(b) &&
         a.persisted_at == b.persisted_at;
}

} // namespace eventstore::model
