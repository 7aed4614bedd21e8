#pragma once
#include <algorithm>
#include <cmath>
#include <geoalloc/common/types.hpp>
#include <numbers>

namespace geoalloc::distance {

  inline constexpr double EARTH_RADIUS_M = 6371000.0;

  [[nodiscard]] inline double planar_distance(Coordinate a, Coordinate b) noexcept {
    return std::hypot(a.longitude - b.longitude, a.latitude - b.latitude);
  }

  [[nodiscard]] inline double great_circle_distance(Coordinate a, Coordinate b) noexcept {
    constexpr double to_rad = std::numbers::pi / 180.0;
    const double lat1 = a.latitude * to_rad;
    const double lat2 = b.latitude * to_rad;
    const double dlat = lat2 - lat1;
    const double dlon = (b.longitude - a.longitude) * to_rad;

    const double s_lat = std::sin(dlat / 2.0);
    const double s_lon = std::sin(dlon / 2.0);
    const double h = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;
    return 2.0 * EARTH_RADIUS_M * std::asin(std::sqrt(std::min(1.0, h)));
  }

}  // namespace geoalloc::distance
