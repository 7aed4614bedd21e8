#include <algorithm>
#include <cmath>
#include <geoalloc/distance/retry.hpp>
#include <thread>

namespace geoalloc::distance {

  std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt) {
    const double raw = policy.initial_backoff_ms * std::pow(policy.multiplier, attempt - 1);
    const double capped = std::min(raw, static_cast<double>(policy.max_backoff_ms));
    return std::chrono::milliseconds(static_cast<long long>(capped));
  }

  bool sleep_unless_cancelled(std::chrono::milliseconds delay, const std::atomic<bool>& cancelled) {
    constexpr std::chrono::milliseconds kSlice{10};
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (!cancelled.load()) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) return true;
      std::this_thread::sleep_for(
          std::min<std::chrono::steady_clock::duration>(kSlice, deadline - now));
    }
    return false;
  }

}  // namespace geoalloc::distance
