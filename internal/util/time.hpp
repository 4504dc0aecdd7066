#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace eventstore::util {

/*
  Time utilities: single place to control clock source and the
  timestamp text format.

  Canonical format: YYYY-MM-DDTHH:MM:SS.mmmZ (UTC, millisecond precision,
  fixed width). Registries compare timestamps as strings, so every stored
  created_at/persisted_at must be canonical.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline constexpr const char* kOriginOfTime = "1970-01-01T00:00:00.000Z";

TimePoint Now();

std::string ToIso8601(TimePoint tp);
std::string NowIso8601();

// Accepts any RFC 3339 timestamp; nullopt if unparseable.
std::optional<TimePoint> ParseIso8601(const std::string& text);

// Re-renders any RFC 3339 timestamp in canonical form.
std::optional<std::string> Canonicalize(const std::string& text);

} // namespace eventstore::util
