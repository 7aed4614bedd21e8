#pragma once
#include <geoalloc/distance/config.hpp>
#include <geoalloc/distance/http_client.hpp>
#include <geoalloc/routing/route.hpp>
#include <memory>
#include <string_view>
#include <variant>

namespace geoalloc::routing {

  // MST doubled and shortcut; at most twice optimal under the triangle inequality.
  struct Approximation {};
  // MST plus minimum-weight matching on odd-degree vertices; at most 1.5x
  // optimal when the matching is exact.
  struct Christofides {};
  // Greedy closest-unvisited walk.
  struct NearestNeighbor {};
  // OR-tools routing search bounded by RouteOptions::time_limit.
  struct CombinatorialSolver {};
  // OSRM-compatible trip service.
  struct TripService {};

  using RouteBackend
      = std::variant<Approximation, Christofides, NearestNeighbor, CombinatorialSolver, TripService>;

  [[nodiscard]] std::string_view backend_name(const RouteBackend& backend) noexcept;
  // mst, christofides, nearest, ortools, trip. Throws ValidationError otherwise.
  [[nodiscard]] RouteBackend parse_backend(std::string_view name);

  class IRouteSolver {
  public:
    virtual ~IRouteSolver() = default;

    [[nodiscard]] virtual Route solve(std::span<const Point> points,
                                      const distance::DistanceMatrix& matrix,
                                      const RouteOptions& options)
        = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
  };

  // `config` and `http` are used by the trip service only.
  [[nodiscard]] std::unique_ptr<IRouteSolver> create_solver(
      const RouteBackend& backend, const distance::DistanceConfig& config = {},
      std::shared_ptr<distance::HttpClient> http = nullptr);

  // Maximum points accepted by the trip service.
  inline constexpr size_t TRIP_SERVICE_MAX_POINTS = 100;

  // Default search budget when no time limit is given.
  inline constexpr std::chrono::milliseconds DEFAULT_TIME_LIMIT{1000};

}  // namespace geoalloc::routing
