#pragma once

#include <spdlog/logger.h>

#include <memory>

#include "config/config.pb.h"
#include "internal/core/event_store.hpp"
#include "internal/db/api/event_registry.hpp"

namespace eventstore::factory {

/*
  BuildRegistry

  Composition root for storage: the ONLY place that knows concrete
  registry types. An unset backend means the in-memory registry.
  Throws std::runtime_error if the requested backend was compiled out.
*/
std::shared_ptr<db::EventRegistry> BuildRegistry(const eventstore::runtime::config::RuntimeConfig& config);

// Registry + retry options + logger wired into a store.
std::unique_ptr<core::EventStore> BuildEventStore(const eventstore::runtime::config::RuntimeConfig& config,
                                                  std::shared_ptr<spdlog::logger>                  logger);

} // namespace eventstore::factory
