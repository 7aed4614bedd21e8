#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace geoalloc {

  // Input columns other than the coordinates, kept in their original order.
  using Attributes = std::vector<std::pair<std::string, std::string>>;

  struct Point {
    std::string id;
    double longitude = 0.0;
    double latitude = 0.0;
    Attributes attributes;
  };

  struct Worker {
    std::string id;
    double longitude = 0.0;
    double latitude = 0.0;
    std::optional<int> capacity;  // unbounded when empty
  };

  struct Coordinate {
    double longitude = 0.0;
    double latitude = 0.0;

    bool operator==(const Coordinate&) const = default;
  };

  [[nodiscard]] inline Coordinate coordinate_of(const Point& p) noexcept {
    return {p.longitude, p.latitude};
  }

  [[nodiscard]] inline Coordinate coordinate_of(const Worker& w) noexcept {
    return {w.longitude, w.latitude};
  }

}  // namespace geoalloc
