#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <geoalloc/assignment/assignment.hpp>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/common/overloaded.hpp>
#include <geoalloc/common/tracy.hpp>
#include <numeric>
#include <string>

namespace geoalloc::assignment {

  namespace {

    const std::array<std::pair<std::string_view, AssignmentMode>, 2> kModeNames{{
        {"point_order", PointOrder{}},
        {"ranking", Ranking{}},
    }};

    void validate_input(std::span<const Point> points, std::span<const Worker> workers,
                        const Matrix<double>& distances) {
      if (workers.empty() && !points.empty()) [[unlikely]] {
        throw ValidationError("assignment needs at least one worker", "workers");
      }
      if (distances.rows() != points.size() || distances.cols() != workers.size()) [[unlikely]] {
        throw ValidationError(fmt::format("distance matrix is {}x{} for {} points and {} workers",
                                          distances.rows(), distances.cols(), points.size(),
                                          workers.size()));
      }
      for (size_t i = 0; i < distances.rows(); ++i) {
        for (size_t j = 0; j < distances.cols(); ++j) {
          const double d = distances(i, j);
          if (!std::isfinite(d) || d < 0.0) [[unlikely]] {
            throw ValidationError(fmt::format("invalid distance {} from point '{}' to worker '{}'",
                                              d, points[i].id, workers[j].id),
                                  points[i].id);
          }
        }
      }
    }

  }  // namespace

  std::string_view mode_name(const AssignmentMode& mode) noexcept {
    return std::visit(overloaded{[](PointOrder) -> std::string_view { return "point_order"; },
                                 [](Ranking) -> std::string_view { return "ranking"; }},
                      mode);
  }

  AssignmentMode parse_mode(std::string_view name) {
    for (const auto& [key, mode] : kModeNames) {
      if (key == name) return mode;
    }
    throw ValidationError("unknown assignment mode '" + std::string(name) + "'", "mode");
  }

  std::vector<size_t> rank_workers(std::span<const double> distances) {
    std::vector<size_t> order(distances.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return distances[a] < distances[b]; });
    return order;
  }

  std::vector<std::optional<int>> resolve_capacities(
      std::span<const Worker> workers, const std::optional<std::vector<int>>& capacities) {
    if (capacities && capacities->size() != workers.size()) [[unlikely]] {
      throw ValidationError(fmt::format("{} capacities given for {} workers", capacities->size(),
                                        workers.size()),
                            "capacity");
    }
    std::vector<std::optional<int>> out;
    out.reserve(workers.size());
    for (size_t w = 0; w < workers.size(); ++w) {
      const auto cap = capacities ? std::optional<int>((*capacities)[w]) : workers[w].capacity;
      if (cap && *cap < 0) [[unlikely]] {
        throw ValidationError(
            fmt::format("worker '{}' has negative capacity {}", workers[w].id, *cap),
            workers[w].id);
      }
      out.push_back(cap);
    }
    return out;
  }

  std::vector<Assignment> assign(std::span<const Point> points, std::span<const Worker> workers,
                                 const Matrix<double>& distances,
                                 const std::optional<std::vector<int>>& capacities) {
    GEOALLOC_ZONE;
    validate_input(points, workers, distances);
    auto remaining = resolve_capacities(workers, capacities);

    std::vector<Assignment> out;
    out.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
      const std::span<const double> row(distances.row(i), distances.cols());
      const auto ranked = rank_workers(row);
      auto it = std::find_if(ranked.begin(), ranked.end(), [&](size_t w) {
        return !remaining[w] || *remaining[w] > 0;
      });
      if (it == ranked.end()) throw CapacityExhaustionError(points[i].id);

      const size_t w = *it;
      if (remaining[w]) --*remaining[w];
      const int rank = static_cast<int>(it - ranked.begin()) + 1;
      if (rank > 1) {
        logger()->debug("point '{}' took worker '{}' at rank {}", points[i].id, workers[w].id,
                        rank);
      }
      out.push_back({i, w, row[w], rank});
    }
    return out;
  }

  std::vector<Assignment> rank_all(std::span<const Point> points, std::span<const Worker> workers,
                                   const Matrix<double>& distances) {
    GEOALLOC_ZONE;
    validate_input(points, workers, distances);
    std::vector<Assignment> out;
    out.reserve(points.size() * workers.size());
    for (size_t i = 0; i < points.size(); ++i) {
      const std::span<const double> row(distances.row(i), distances.cols());
      const auto ranked = rank_workers(row);
      for (size_t r = 0; r < ranked.size(); ++r) {
        out.push_back({i, ranked[r], row[ranked[r]], static_cast<int>(r) + 1});
      }
    }
    return out;
  }

  std::vector<size_t> worker_loads(std::span<const Assignment> assignments, size_t n_workers) {
    std::vector<size_t> loads(n_workers, 0);
    for (const auto& a : assignments) ++loads.at(a.worker);
    return loads;
  }

}  // namespace geoalloc::assignment
