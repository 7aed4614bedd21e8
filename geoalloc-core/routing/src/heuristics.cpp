#include <geoalloc/common/logging.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/distance/spanning_tree.hpp>
#include <geoalloc/routing/tour.hpp>

#include "solvers.hpp"

namespace geoalloc::routing {

  // =============================================================================
  // MST Doubling
  // =============================================================================

  class ApproximationSolver : public IRouteSolver {
  public:
    [[nodiscard]] Route solve(std::span<const Point> points,
                              const distance::DistanceMatrix& matrix,
                              const RouteOptions& options) override {
      GEOALLOC_ZONE;
      validate_route_input(points, matrix, options);
      if (auto order = trivial_order(points.size(), options.start)) {
        return finalize_route(std::move(*order), matrix, options, name());
      }

      const auto tree = distance::minimum_spanning_tree(matrix, options.start.value_or(0));
      auto order = shortcut(doubled_tree_walk(tree), points.size());
      logger()->debug("mst route over {} points, tree weight {:.6g}", points.size(), tree.weight);
      return finalize_route(std::move(order), matrix, options, name());
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "mst"; }
  };

  // =============================================================================
  // Christofides
  // =============================================================================

  class ChristofidesSolver : public IRouteSolver {
  public:
    [[nodiscard]] Route solve(std::span<const Point> points,
                              const distance::DistanceMatrix& matrix,
                              const RouteOptions& options) override {
      GEOALLOC_ZONE;
      validate_route_input(points, matrix, options);
      if (auto order = trivial_order(points.size(), options.start)) {
        return finalize_route(std::move(*order), matrix, options, name());
      }

      const size_t n = points.size();
      const size_t root = options.start.value_or(0);
      const auto tree = distance::minimum_spanning_tree(matrix, root);

      std::vector<Edge> edges;
      edges.reserve(2 * n);
      for (size_t v = 0; v < n; ++v) {
        if (tree.parent[v] != distance::SpanningTree::npos) edges.emplace_back(tree.parent[v], v);
      }
      const auto matching = min_weight_matching(matrix, odd_degree_vertices(tree));
      edges.insert(edges.end(), matching.begin(), matching.end());

      auto order = shortcut(eulerian_circuit(n, edges, root), n);
      return finalize_route(std::move(order), matrix, options, name());
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "christofides"; }
  };

  // =============================================================================
  // Nearest Neighbour
  // =============================================================================

  class NearestNeighborSolver : public IRouteSolver {
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

      std::vector<bool> visited(n, false);
      std::vector<size_t> order{options.start.value_or(0)};
      visited[order.front()] = true;
      while (order.size() < n) {
        const size_t cur = order.back();
        size_t best = n;
        for (size_t j = 0; j < n; ++j) {
          if (visited[j]) continue;
          if (best == n || matrix(cur, j) < matrix(cur, best)) best = j;
        }
        visited[best] = true;
        order.push_back(best);
      }
      return finalize_route(std::move(order), matrix, options, name());
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "nearest"; }
  };

  std::unique_ptr<IRouteSolver> make_approximation_solver() {
    return std::make_unique<ApproximationSolver>();
  }

  std::unique_ptr<IRouteSolver> make_christofides_solver() {
    return std::make_unique<ChristofidesSolver>();
  }

  std::unique_ptr<IRouteSolver> make_nearest_neighbor_solver() {
    return std::make_unique<NearestNeighborSolver>();
  }

}  // namespace geoalloc::routing
