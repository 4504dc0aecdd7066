#pragma once

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eventstore::retry {

enum class BackoffKind {
  kFixed,
  kExponential,
};

struct RetryOptions {
  // total invocations, first call included
  std::uint32_t             max_attempts = 3;
  BackoffKind               backoff      = BackoffKind::kExponential;
  std::chrono::milliseconds initial_delay{10};
  std::chrono::milliseconds max_delay{1000};
  double                    multiplier = 2.0;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// std::this_thread::sleep_for
void SleepFor(std::chrono::milliseconds delay);

// Delay to wait after the given failed attempt (1-based).
std::chrono::milliseconds BackoffDelay(const RetryOptions& options, std::uint32_t failed_attempt);

/*
  Runs op, retrying only failures whose ErrorKind equals retry_on.

  - success returns immediately
  - EventStoreError of kind retry_on: up to max_attempts - 1 retries with a
    backoff sleep between attempts, then the last error is rethrown
  - anything else propagates on the spot, without retry

  The caller is not expected to resolve the conflict; a persistent conflict
  means the producer has to re-derive its version and resubmit.
*/
template <typename Operation>
auto RetryIfError(Operation&& op, util::ErrorKind retry_on, const RetryOptions& options, const Sleeper& sleep,
                  spdlog::logger& logger) -> decltype(op()) {
  if (options.max_attempts < 1) {
    throw std::invalid_argument("retry max_attempts must be at least 1");
  }

  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      return op();
    } catch (const util::EventStoreError& e) {
      if (e.Kind() != retry_on || attempt >= options.max_attempts) {
        throw;
      }

      const auto delay = BackoffDelay(options, attempt);
      observability::LogWarn(logger, "retrying after error",
                             {observability::StringField("kind", util::ToString(e.Kind())),
                              observability::IntField("attempt", attempt),
                              observability::IntField("max_attempts", options.max_attempts),
                              observability::IntField("delay_ms", delay.count()),
                              observability::StringField("error", e.what())});
      if (sleep) {
        sleep(delay);
      }
    }
  }
}

} // namespace eventstore::retry
