#include <array>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/overloaded.hpp>
#include <geoalloc/routing/solver.hpp>
#include <string>
#include <utility>

#include "solvers.hpp"

namespace geoalloc::routing {

  namespace {

    const std::array<std::pair<std::string_view, RouteBackend>, 5> kBackendNames{{
        {"mst", Approximation{}},
        {"christofides", Christofides{}},
        {"nearest", NearestNeighbor{}},
        {"ortools", CombinatorialSolver{}},
        {"trip", TripService{}},
    }};

  }  // namespace

  std::string_view backend_name(const RouteBackend& backend) noexcept {
    for (const auto& [key, value] : kBackendNames) {
      if (value.index() == backend.index()) return key;
    }
    return "unknown";
  }

  RouteBackend parse_backend(std::string_view name) {
    for (const auto& [key, backend] : kBackendNames) {
      if (key == name) return backend;
    }
    throw ValidationError("unknown route backend '" + std::string(name) + "'", "backend");
  }

  std::unique_ptr<IRouteSolver> create_solver(const RouteBackend& backend,
                                              const distance::DistanceConfig& config,
                                              std::shared_ptr<distance::HttpClient> http) {
    return std::visit(
        overloaded{
            [](Approximation) { return make_approximation_solver(); },
            [](Christofides) { return make_christofides_solver(); },
            [](NearestNeighbor) { return make_nearest_neighbor_solver(); },
            [](CombinatorialSolver) { return make_ortools_solver(); },
            [&](TripService) { return make_trip_service_solver(config, std::move(http)); },
        },
        backend);
  }

}  // namespace geoalloc::routing
