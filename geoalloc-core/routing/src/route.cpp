#include <fmt/format.h>

#include <algorithm>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/routing/route.hpp>

namespace geoalloc::routing {

  double route_distance(const distance::DistanceMatrix& matrix, std::span<const size_t> order,
                        bool closed) {
    double total = 0.0;
    for (size_t i = 1; i < order.size(); ++i) total += matrix(order[i - 1], order[i]);
    if (closed && order.size() > 1) total += matrix(order.back(), order.front());
    return total;
  }

  void validate_route_input(std::span<const Point> points, const distance::DistanceMatrix& matrix,
                            const RouteOptions& options) {
    if (matrix.size() != points.size() || !matrix.distances.square()) [[unlikely]] {
      throw ValidationError(fmt::format("distance matrix is {}x{} for {} points",
                                        matrix.distances.rows(), matrix.distances.cols(),
                                        points.size()));
    }
    matrix.validate();
    if (options.start && *options.start >= points.size()) [[unlikely]] {
      throw ValidationError(
          fmt::format("start index {} out of range for {} points", *options.start, points.size()),
          "start");
    }
    if (options.time_limit && options.time_limit->count() <= 0) [[unlikely]] {
      throw ValidationError(
          fmt::format("time limit must be positive, got {} ms", options.time_limit->count()),
          "time_limit");
    }
  }

  std::optional<std::vector<size_t>> trivial_order(size_t n, std::optional<size_t> start) {
    if (n == 0) return std::vector<size_t>{};
    if (n == 1) return std::vector<size_t>{0};
    if (n == 2) {
      const size_t s = start.value_or(0);
      return std::vector<size_t>{s, 1 - s};
    }
    return std::nullopt;
  }

  Route finalize_route(std::vector<size_t> order, const distance::DistanceMatrix& matrix,
                       const RouteOptions& options, std::string_view backend) {
    const size_t n = matrix.size();
    std::vector<bool> seen(n, false);
    bool valid = order.size() == n;
    for (size_t i = 0; valid && i < order.size(); ++i) {
      valid = order[i] < n && !seen[order[i]];
      if (valid) seen[order[i]] = true;
    }
    if (!valid) {
      throw SolverError("route", n,
                        fmt::format("{} returned an order that is not a permutation", backend));
    }

    if (options.start && !order.empty() && order.front() != *options.start) {
      if (!options.closed) {
        throw SolverError("route", n,
                          fmt::format("{} did not honour the fixed start {}", backend,
                                      *options.start));
      }
      std::rotate(order.begin(), std::find(order.begin(), order.end(), *options.start),
                  order.end());
    }

    Route route;
    route.total_distance = route_distance(matrix, order, options.closed);
    route.order = std::move(order);
    route.closed = options.closed;
    route.backend = std::string(backend);
    return route;
  }

}  // namespace geoalloc::routing
