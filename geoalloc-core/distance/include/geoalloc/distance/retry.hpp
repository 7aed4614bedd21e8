#pragma once
#include <atomic>
#include <chrono>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/distance/config.hpp>

namespace geoalloc::distance {

  // Delay before retry number `attempt` (1-based), capped at max_backoff_ms.
  [[nodiscard]] std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt);

  // Sleeps for `delay` in short slices. Returns false as soon as `cancelled` is set.
  [[nodiscard]] bool sleep_unless_cancelled(std::chrono::milliseconds delay,
                                            const std::atomic<bool>& cancelled);

  // Calls fn until it succeeds, a permanent ExternalServiceError is raised,
  // attempts run out or `cancelled` is set. Only transient errors are retried.
  // Cancellation during a backoff rethrows the last error without another call.
  template <typename Fn>
  auto with_retry(const RetryPolicy& policy, const std::atomic<bool>& cancelled, Fn&& fn)
      -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
      try {
        return fn();
      } catch (const ExternalServiceError& e) {
        if (!e.transient() || attempt >= policy.max_attempts || cancelled.load()) throw;
        const auto delay = backoff_delay(policy, attempt);
        logger()->warn("{}; retrying in {} ms (attempt {}/{})", e.what(), delay.count(),
                       attempt + 1, policy.max_attempts);
        if (!sleep_unless_cancelled(delay, cancelled)) throw;
      }
    }
  }

}  // namespace geoalloc::distance
