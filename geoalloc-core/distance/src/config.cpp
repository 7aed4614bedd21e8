#include <fmt/format.h>

#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/config.hpp>
#include <nlohmann/json.hpp>

namespace geoalloc::distance {

  using json = nlohmann::json;

  // ============================================================================
  // JSON Serialization - RetryPolicy
  // ============================================================================

  void to_json(json& j, const RetryPolicy& p) {
    j = {{"max_attempts", p.max_attempts},
         {"initial_backoff_ms", p.initial_backoff_ms},
         {"multiplier", p.multiplier},
         {"max_backoff_ms", p.max_backoff_ms}};
  }

  void from_json(const json& j, RetryPolicy& p) {
    p.max_attempts = j.value("max_attempts", 4);
    p.initial_backoff_ms = j.value("initial_backoff_ms", 200);
    p.multiplier = j.value("multiplier", 2.0);
    p.max_backoff_ms = j.value("max_backoff_ms", 5000);
  }

  // ============================================================================
  // JSON Serialization - DistanceConfig
  // ============================================================================

  // The API key is never written back out.
  void to_json(json& j, const DistanceConfig& c) {
    j = {{"max_table_size", c.max_table_size},
         {"max_in_flight", c.max_in_flight},
         {"timeout_ms", c.timeout_ms},
         {"retry", c.retry},
         {"with_durations", c.with_durations},
         {"base_url", c.base_url}};
  }

  void from_json(const json& j, DistanceConfig& c) {
    c.max_table_size = j.value("max_table_size", 100);
    c.max_in_flight = j.value("max_in_flight", 4);
    c.timeout_ms = j.value("timeout_ms", 10000);
    c.retry = j.value("retry", RetryPolicy{});
    c.with_durations = j.value("with_durations", false);
    c.base_url = j.value("base_url", "");
    c.api_key = j.value("api_key", "");
  }

  void DistanceConfig::validate() const {
    if (max_table_size < 1) {
      throw ValidationError(
          fmt::format("max_table_size must be positive, got {}", max_table_size),
          "max_table_size");
    }
    if (max_in_flight < 1) {
      throw ValidationError(fmt::format("max_in_flight must be positive, got {}", max_in_flight),
                            "max_in_flight");
    }
    if (timeout_ms < 1) {
      throw ValidationError(fmt::format("timeout_ms must be positive, got {}", timeout_ms),
                            "timeout_ms");
    }
    if (retry.max_attempts < 1) {
      throw ValidationError(
          fmt::format("retry.max_attempts must be positive, got {}", retry.max_attempts),
          "retry.max_attempts");
    }
    if (retry.initial_backoff_ms < 0 || retry.max_backoff_ms < retry.initial_backoff_ms) {
      throw ValidationError(fmt::format("invalid backoff range [{}, {}] ms",
                                        retry.initial_backoff_ms, retry.max_backoff_ms),
                            "retry");
    }
    if (retry.multiplier < 1.0) {
      throw ValidationError(
          fmt::format("retry.multiplier must be >= 1, got {}", retry.multiplier),
          "retry.multiplier");
    }
  }

}  // namespace geoalloc::distance
