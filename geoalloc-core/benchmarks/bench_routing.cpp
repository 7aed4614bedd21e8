#include <benchmark/benchmark.h>

#include <geoalloc/distance/provider.hpp>
#include <geoalloc/routing/solver.hpp>
#include <random>
#include <string>
#include <vector>

using namespace geoalloc;
using namespace geoalloc::routing;

namespace {

std::vector<Point> generate_points(int n, uint32_t seed = 42) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> lon(100.3, 100.7);
  std::uniform_real_distribution<double> lat(13.5, 13.9);
  std::vector<Point> points(n);
  for (int i = 0; i < n; ++i) {
    points[i] = {std::to_string(i), lon(rng), lat(rng), {}};
  }
  return points;
}

void run_solver(benchmark::State& state, const RouteBackend& backend) {
  const auto points = generate_points(state.range(0));
  const auto matrix = distance::compute(points, distance::GreatCircle{});
  auto solver = create_solver(backend);
  const RouteOptions options{.start = std::nullopt, .closed = true, .time_limit = std::nullopt};

  for (auto _ : state) {
    auto route = solver->solve(points, matrix, options);
    benchmark::DoNotOptimize(route);
  }

  state.SetLabel(std::string(solver->name()) + "/" + std::to_string(state.range(0)) + "p");
}

}  // namespace

static void BM_Route_Approximation(benchmark::State& state) {
  run_solver(state, Approximation{});
}

static void BM_Route_Christofides(benchmark::State& state) { run_solver(state, Christofides{}); }

static void BM_Route_NearestNeighbor(benchmark::State& state) {
  run_solver(state, NearestNeighbor{});
}

static void RouteArgs(benchmark::internal::Benchmark* b) {
  for (int n : {10, 50, 200, 1000}) {
    b->Args({n});
  }
  b->Unit(benchmark::kMicrosecond);
}

BENCHMARK(BM_Route_Approximation)->Apply(RouteArgs);
BENCHMARK(BM_Route_Christofides)->Apply(RouteArgs);
BENCHMARK(BM_Route_NearestNeighbor)->Apply(RouteArgs);
