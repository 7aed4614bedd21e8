#pragma once
#include <geoalloc/routing/solver.hpp>
#include <memory>

namespace geoalloc::routing {

  [[nodiscard]] std::unique_ptr<IRouteSolver> make_approximation_solver();
  [[nodiscard]] std::unique_ptr<IRouteSolver> make_christofides_solver();
  [[nodiscard]] std::unique_ptr<IRouteSolver> make_nearest_neighbor_solver();
  [[nodiscard]] std::unique_ptr<IRouteSolver> make_ortools_solver();
  [[nodiscard]] std::unique_ptr<IRouteSolver> make_trip_service_solver(
      const distance::DistanceConfig& config, std::shared_ptr<distance::HttpClient> http);

}  // namespace geoalloc::routing
