#pragma once
#include <string_view>
#include <variant>

namespace geoalloc::distance {

  // Euclidean distance on raw (longitude, latitude) pairs.
  struct Planar {};
  // Haversine distance in meters on a sphere of radius EARTH_RADIUS_M.
  struct GreatCircle {};
  // OSRM-compatible table service, road distance in meters.
  struct ExternalRouting {};
  // Google-Distance-Matrix-compatible service, road distance in meters. Needs an API key.
  struct ExternalMapping {};

  using DistanceMetric = std::variant<Planar, GreatCircle, ExternalRouting, ExternalMapping>;

  [[nodiscard]] std::string_view metric_name(const DistanceMetric& metric) noexcept;

  // Accepts planar, great-circle, external-routing, external-mapping and the
  // aliases euclidean, haversine, osrm, google. Throws ValidationError otherwise.
  [[nodiscard]] DistanceMetric parse_metric(std::string_view name);

  [[nodiscard]] bool is_external(const DistanceMetric& metric) noexcept;

  // Road distances are directed; geometric ones are not.
  [[nodiscard]] inline bool is_symmetric(const DistanceMetric& metric) noexcept {
    return !is_external(metric);
  }

}  // namespace geoalloc::distance
