#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace eventstore::retry {

void SleepFor(std::chrono::milliseconds delay) {
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
}

std::chrono::milliseconds BackoffDelay(const RetryOptions& options, std::uint32_t failed_attempt) {
  if (options.backoff == BackoffKind::kFixed || failed_attempt <= 1) {
    return std::min(options.initial_delay, options.max_delay);
  }

  const double scaled =
      static_cast<double>(options.initial_delay.count()) * std::pow(options.multiplier, static_cast<double>(failed_attempt - 1));
  const double capped = std::min(scaled, static_cast<double>(options.max_delay.count()));
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}

} // namespace eventstore::retry
