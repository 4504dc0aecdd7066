#pragma once

#include <optional>
#include <string>

#include "internal/model/envelope_kind.hpp"

namespace eventstore::db {

/*
  Typed query predicates.

  The record kind is fixed by the filter type; backends never see an
  untyped key/value query.
*/

struct EventFilter {
  std::string entity_type_name;
  std::string entity_id;

  // exclusive lower bound on created_at; unset = no bound
  std::optional<std::string> created_after;

  static constexpr model::EnvelopeKind Kind() {
    return model::EnvelopeKind::kEvent;
  }
};

struct SnapshotFilter {
  std::string entity_type_name;
  std::string entity_id;

  static constexpr model::EnvelopeKind Kind() {
    return model::EnvelopeKind::kSnapshot;
  }
};

} // namespace eventstore::db
