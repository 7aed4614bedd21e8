#include <geoalloc/common/errors.hpp>

#include "solvers.hpp"

#ifdef GEOALLOC_HAS_ORTOOLS
#  include <ortools/constraint_solver/routing.h>
#  include <ortools/constraint_solver/routing_index_manager.h>
#  include <ortools/constraint_solver/routing_parameters.h>

#  include <fmt/format.h>

#  include <cmath>
#  include <geoalloc/common/logging.hpp>
#  include <geoalloc/common/tracy.hpp>

using operations_research::Assignment;
using operations_research::RoutingIndexManager;
using operations_research::RoutingModel;
using operations_research::RoutingSearchParameters;
#endif

namespace geoalloc::routing {

#ifdef GEOALLOC_HAS_ORTOOLS

  namespace {

    // Arc costs are integers; distances keep three decimals.
    constexpr double kCostScale = 1000.0;

  }  // namespace

  // =============================================================================
  // OR-tools Routing
  // =============================================================================

  class OrToolsSolver : public IRouteSolver {
  public:
    [[nodiscard]] Route solve(std::span<const Point> points,
                              const distance::DistanceMatrix& matrix,
                              const RouteOptions& options) override {
      GEOALLOC_ZONE;
      validate_route_input(points, matrix, options);
      const size_t n = points.size();
      if (auto order = trivial_order(n, options.start)) {
        return finalize_route(std::move(*order), matrix, options, name());
      }

      const auto depot = RoutingIndexManager::NodeIndex(static_cast<int>(options.start.value_or(0)));
      // An open path ends at a dummy node that costs nothing to reach.
      const int dummy = static_cast<int>(n);
      std::unique_ptr<RoutingIndexManager> manager;
      if (options.closed) {
        manager = std::make_unique<RoutingIndexManager>(static_cast<int>(n), 1, depot);
      } else {
        manager = std::make_unique<RoutingIndexManager>(
            static_cast<int>(n) + 1, 1, std::vector<RoutingIndexManager::NodeIndex>{depot},
            std::vector<RoutingIndexManager::NodeIndex>{RoutingIndexManager::NodeIndex(dummy)});
      }
      RoutingModel routing(*manager);

      const int transit = routing.RegisterTransitCallback(
          [&](int64_t from_index, int64_t to_index) -> int64_t {
            const int from = manager->IndexToNode(from_index).value();
            const int to = manager->IndexToNode(to_index).value();
            if (from == dummy || to == dummy) return 0;
            return static_cast<int64_t>(std::llround(matrix(from, to) * kCostScale));
          });
      routing.SetArcCostEvaluatorOfAllVehicles(transit);

      RoutingSearchParameters params = operations_research::DefaultRoutingSearchParameters();
      params.set_first_solution_strategy(
          operations_research::FirstSolutionStrategy::PATH_CHEAPEST_ARC);
      params.set_local_search_metaheuristic(
          operations_research::LocalSearchMetaheuristic::GUIDED_LOCAL_SEARCH);
      const auto limit = options.time_limit.value_or(DEFAULT_TIME_LIMIT);
      params.mutable_time_limit()->set_seconds(limit.count() / 1000);
      params.mutable_time_limit()->set_nanos(static_cast<int32_t>((limit.count() % 1000) * 1000000));

      const Assignment* solution = routing.SolveWithParameters(params);
      if (solution == nullptr) {
        throw SolverError("route", n,
                          fmt::format("OR-tools found no tour within {} ms", limit.count()));
      }

      std::vector<size_t> order;
      order.reserve(n);
      for (int64_t idx = routing.Start(0); !routing.IsEnd(idx);
           idx = solution->Value(routing.NextVar(idx))) {
        order.push_back(static_cast<size_t>(manager->IndexToNode(idx).value()));
      }
      logger()->debug("OR-tools tour over {} points, objective {}", n, solution->ObjectiveValue());
      return finalize_route(std::move(order), matrix, options, name());
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "ortools"; }
  };

  std::unique_ptr<IRouteSolver> make_ortools_solver() { return std::make_unique<OrToolsSolver>(); }

#else

  std::unique_ptr<IRouteSolver> make_ortools_solver() {
    throw ValidationError("OR-tools backend not compiled", "backend");
  }

#endif

}  // namespace geoalloc::routing
