#include <benchmark/benchmark.h>

#include <geoalloc/distance/provider.hpp>
#include <geoalloc/distance/spanning_tree.hpp>
#include <random>
#include <string>
#include <vector>

using namespace geoalloc;
using namespace geoalloc::distance;

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

}  // namespace

static void BM_Compute_Planar(benchmark::State& state) {
  const auto points = generate_points(state.range(0));
  for (auto _ : state) {
    auto matrix = compute(points, Planar{});
    benchmark::DoNotOptimize(matrix);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0) * state.range(0));
  state.SetLabel(std::to_string(state.range(0)) + "p");
}

static void BM_Compute_GreatCircle(benchmark::State& state) {
  const auto points = generate_points(state.range(0));
  for (auto _ : state) {
    auto matrix = compute(points, GreatCircle{});
    benchmark::DoNotOptimize(matrix);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0) * state.range(0));
  state.SetLabel(std::to_string(state.range(0)) + "p");
}

static void BM_MinimumSpanningTree(benchmark::State& state) {
  const auto points = generate_points(state.range(0));
  const auto matrix = compute(points, GreatCircle{});
  for (auto _ : state) {
    auto tree = minimum_spanning_tree(matrix);
    benchmark::DoNotOptimize(tree);
  }
  state.SetLabel(std::to_string(state.range(0)) + "p");
}

static void PointCountArgs(benchmark::internal::Benchmark* b) {
  for (int n : {10, 100, 500, 1000, 2000}) {
    b->Args({n});
  }
  b->Unit(benchmark::kMicrosecond);
}

BENCHMARK(BM_Compute_Planar)->Apply(PointCountArgs);
BENCHMARK(BM_Compute_GreatCircle)->Apply(PointCountArgs);
BENCHMARK(BM_MinimumSpanningTree)->Apply(PointCountArgs);
