#pragma once
#include <chrono>
#include <cstddef>
#include <geoalloc/common/types.hpp>
#include <geoalloc/distance/distance_matrix.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace geoalloc::routing {

  // Visiting order over point indices. total_distance is always recomputed
  // from the distance matrix, closing edge included when `closed`.
  struct Route {
    std::vector<size_t> order;
    double total_distance = 0.0;
    bool closed = false;
    std::string backend;
  };

  struct RouteOptions {
    std::optional<size_t> start;  // fixes the first point
    bool closed = true;           // return to the first point; false for an open path
    std::optional<std::chrono::milliseconds> time_limit;
  };

  [[nodiscard]] double route_distance(const distance::DistanceMatrix& matrix,
                                      std::span<const size_t> order, bool closed);

  // Throws ValidationError for a matrix/point mismatch, a start out of range
  // or a non-positive time limit.
  void validate_route_input(std::span<const Point> points, const distance::DistanceMatrix& matrix,
                            const RouteOptions& options);

  // Orders for 0, 1 or 2 points, which need no search.
  [[nodiscard]] std::optional<std::vector<size_t>> trivial_order(size_t n,
                                                                 std::optional<size_t> start);

  // Checks that `order` is a permutation of [0, n), rotates a closed tour to
  // begin at the fixed start and recomputes the total. Throws SolverError
  // tagged with `backend` when the order is unusable.
  [[nodiscard]] Route finalize_route(std::vector<size_t> order,
                                     const distance::DistanceMatrix& matrix,
                                     const RouteOptions& options, std::string_view backend);

}  // namespace geoalloc::routing
