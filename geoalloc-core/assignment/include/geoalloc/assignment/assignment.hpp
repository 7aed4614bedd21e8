#pragma once
#include <cstddef>
#include <geoalloc/common/matrix.hpp>
#include <geoalloc/common/types.hpp>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace geoalloc::assignment {

  // Points are served in input order, each taking its nearest worker with
  // capacity left. First come, first served; not a globally optimal matching.
  struct PointOrder {};
  // Every worker for every point, sorted by distance. Capacities are ignored.
  struct Ranking {};

  using AssignmentMode = std::variant<PointOrder, Ranking>;

  [[nodiscard]] std::string_view mode_name(const AssignmentMode& mode) noexcept;
  // point_order, ranking. Throws ValidationError otherwise.
  [[nodiscard]] AssignmentMode parse_mode(std::string_view name);

  struct Assignment {
    size_t point = 0;
    size_t worker = 0;
    double distance = 0.0;
    int rank = 0;  // 1-based position of `worker` in the point's sorted list

    bool operator==(const Assignment&) const = default;
  };

  // Worker indices ordered by ascending distance, ties kept in input order.
  [[nodiscard]] std::vector<size_t> rank_workers(std::span<const double> distances);

  // Capacity per worker: `capacities` when given (one entry per worker),
  // otherwise Worker::capacity. Empty means unbounded. Throws ValidationError
  // on a size mismatch or a negative capacity.
  [[nodiscard]] std::vector<std::optional<int>> resolve_capacities(
      std::span<const Worker> workers, const std::optional<std::vector<int>>& capacities);

  // Greedy capacity-bounded assignment over a points x workers matrix. Returns
  // one record per point in point order. Throws CapacityExhaustionError naming
  // the first point that no worker can take.
  [[nodiscard]] std::vector<Assignment> assign(
      std::span<const Point> points, std::span<const Worker> workers,
      const Matrix<double>& distances, const std::optional<std::vector<int>>& capacities = {});

  // points.size() * workers.size() records, grouped by point, rank ascending.
  [[nodiscard]] std::vector<Assignment> rank_all(std::span<const Point> points,
                                                 std::span<const Worker> workers,
                                                 const Matrix<double>& distances);

  // Worker index -> number of assigned points.
  [[nodiscard]] std::vector<size_t> worker_loads(std::span<const Assignment> assignments,
                                                 size_t n_workers);

}  // namespace geoalloc::assignment
