#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"

namespace eventstore::util {

/*
  Central error types.

  Every error the store core raises carries an ErrorKind so callers (and the
  retry policy) can select on kind without string matching.
*/

enum class ErrorKind {
  kConflict,
  kRegistry,
  kDispatch,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConflict:
      return "conflict";
    case ErrorKind::kRegistry:
      return "registry";
    case ErrorKind::kDispatch:
    default:
      return "dispatch";
  }
}

class EventStoreError : public std::runtime_error {
 public:
  EventStoreError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Entity stream already advanced past the record's version.
class ConflictError : public EventStoreError {
 public:
  explicit ConflictError(const std::string& msg) : EventStoreError(ErrorKind::kConflict, msg) {
  }
};

// Any other storage failure. Never retried.
class RegistryError : public EventStoreError {
 public:
  RegistryError(db::ErrorCode code, const std::string& msg) : EventStoreError(ErrorKind::kRegistry, msg), code_(code) {
  }

  db::ErrorCode Code() const noexcept {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

// Batch persisted but downstream dispatch failed. Redeliver, do not re-persist.
class DispatchError : public EventStoreError {
 public:
  explicit DispatchError(const std::string& msg) : EventStoreError(ErrorKind::kDispatch, msg) {
  }
};

// Translates a non-OK registry result into the matching error kind.
void ThrowIfRegistryError(const db::Result& result, const std::string& context);

} // namespace eventstore::util
