#pragma once
#include <cstdint>
#include <geoalloc/assignment/assignment.hpp>
#include <geoalloc/clustering/cluster.hpp>
#include <geoalloc/distance/config.hpp>
#include <geoalloc/distance/metric.hpp>
#include <geoalloc/routing/solver.hpp>
#include <optional>
#include <string>

namespace geoalloc::engine {

  // Environment variable consulted when no maps API key is configured.
  inline constexpr const char* MAPS_API_KEY_ENV = "GEOALLOC_MAPS_API_KEY";

  struct DistanceSettings {
    distance::DistanceMetric metric = distance::GreatCircle{};
    distance::DistanceConfig config;
  };

  struct ClusteringSettings {
    clustering::PartitionMethod method = clustering::KMeans{};
    int k = 0;
    uint64_t seed = 42;
  };

  struct RoutingSettings {
    routing::RouteBackend backend = routing::Approximation{};
    bool closed = true;
    std::optional<int64_t> time_limit_ms;
    std::optional<std::string> start;  // point id
  };

  struct AssignmentSettings {
    assignment::AssignmentMode mode = assignment::PointOrder{};
  };

  struct EngineConfig {
    DistanceSettings distance;
    ClusteringSettings clustering;
    RoutingSettings routing;
    AssignmentSettings assignment;
    std::string log_level = "warn";

    [[nodiscard]] static EngineConfig from_json(const std::string& path);
    [[nodiscard]] static EngineConfig from_json_string(const std::string& json_str);
    [[nodiscard]] static EngineConfig from_msgpack(const std::string& path);
    [[nodiscard]] static EngineConfig from_msgpack_string(const std::string& data);

    // The API key is never serialised.
    [[nodiscard]] std::string to_json_string() const;
    [[nodiscard]] std::string to_msgpack_string() const;

    // Fills an empty API key from MAPS_API_KEY_ENV.
    void resolve_api_key();

    // Throws ValidationError naming the offending key.
    void validate() const;
  };

}  // namespace geoalloc::engine
