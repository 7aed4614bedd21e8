#pragma once
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace geoalloc::distance {

  // Bounded exponential backoff for transient external failures.
  struct RetryPolicy {
    int max_attempts = 4;
    int initial_backoff_ms = 200;
    double multiplier = 2.0;
    int max_backoff_ms = 5000;
  };

  inline constexpr const char* DEFAULT_OSRM_URL = "http://router.project-osrm.org";
  inline constexpr const char* DEFAULT_MAPS_URL = "https://maps.googleapis.com";

  struct DistanceConfig {
    int max_table_size = 100;  // per-axis chunk limit for the routing service
    int max_in_flight = 4;
    int timeout_ms = 10000;
    RetryPolicy retry;
    bool with_durations = false;
    std::string base_url;  // empty selects the service default
    std::string api_key;

    void validate() const;
  };

  void to_json(nlohmann::json& j, const RetryPolicy& p);
  void from_json(const nlohmann::json& j, RetryPolicy& p);
  void to_json(nlohmann::json& j, const DistanceConfig& c);
  void from_json(const nlohmann::json& j, DistanceConfig& c);

}  // namespace geoalloc::distance
