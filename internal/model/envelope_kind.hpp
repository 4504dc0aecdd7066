#pragma once

#include <cstdint>
#include <string_view>

namespace eventstore::model {

enum class EnvelopeKind : std::uint8_t {
  kEvent    = 1,
  kSnapshot = 2,
};

constexpr std::string_view ToString(EnvelopeKind kind) {
  switch (kind) {
    case EnvelopeKind::kEvent:
      return "event";
    case EnvelopeKind::kSnapshot:
    default:
      return "snapshot";
  }
}

} // namespace eventstore::model
