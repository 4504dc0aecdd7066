#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/envelope_kind.hpp"

namespace eventstore::model {

/*
  Folded entity state at a given stream position.

  Snapshots are a replaceable cache: at most one is "latest" per entity and
  losing all of them only makes replay slower.
*/
struct EntitySnapshotEnvelope {
  static constexpr EnvelopeKind kKind = EnvelopeKind::kSnapshot;

  std::string entity_type_name;
  std::string entity_id;

  // entity type the state folds into
  std::string type_name;

  // folded state, opaque JSON
  std::string value;

  std::string request_id;

  // time of the fold
  std::string created_at;

  // created_at of the last event already folded into value
  std::string snapshotted_event_created_at;

  // stream position of the last folded event
  std::optional<std::uint64_t> version;

  // stamped at store time
  std::string persisted_at;
};

inline bool operator==(const EntitySnapshotEnvelope& a, const EntitySnapshotEnvelope& b) {
  return a.entity_type_name == b.entity_type_name && a.entity_id == b.entity_id && a.type_name == b.type_name &&
         a.value == b.value && a.request_id == b.request_id && a.created_at == b.created_at &&
         a.snapshotted_event_created_at == b.snapshotted_event_created_at && a.version == b.version &&
         a.persisted_at == b.persisted_at;
}

} // namespace eventstore::model
