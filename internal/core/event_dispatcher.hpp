#pragma once

#include <spdlog/logger.h>

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "internal/model/event_envelope.hpp"

namespace eventstore::core {

/*
  Downstream fan-out of a persisted batch.

  Receives the batch in its pre-persistence form and original order. Any
  exception thrown here reaches the caller of StoreEvents as a DispatchError;
  the events are already durable at that point.
*/
class EventDispatcher {
 public:
  virtual ~EventDispatcher() = default;

  virtual void Dispatch(const std::vector<model::NonPersistedEventEnvelope>& envelopes) = 0;
};

class CallbackDispatcher final : public EventDispatcher {
 public:
  using Callback = std::function<void(const std::vector<model::NonPersistedEventEnvelope>&)>;

  explicit CallbackDispatcher(Callback callback) : callback_(std::move(callback)) {
  }

  void Dispatch(const std::vector<model::NonPersistedEventEnvelope>& envelopes) override {
    if (callback_) {
      callback_(envelopes);
    }
  }

 private:
  Callback callback_;
};

// Logs one line per dispatched envelope.
class LoggingDispatcher final : public EventDispatcher {
 public:
  explicit LoggingDispatcher(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {
  }

  void Dispatch(const std::vector<model::NonPersistedEventEnvelope>& envelopes) override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace eventstore::core
