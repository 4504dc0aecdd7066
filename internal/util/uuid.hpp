#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace eventstore::util {

/*
  UUID helpers

  Request ids and generated entity ids are random RFC4122 v4 UUIDs in
  canonical 8-4-4-4-12 text form. Entity ids supplied by callers stay opaque
  strings and are never parsed.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// GenerateUUID() rendered as text
std::string GenerateRequestID();

} // namespace eventstore::util
