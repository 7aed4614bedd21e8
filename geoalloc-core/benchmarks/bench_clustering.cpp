#include <benchmark/benchmark.h>

#include <geoalloc/clustering/cluster.hpp>
#include <geoalloc/distance/provider.hpp>
#include <random>
#include <string>
#include <vector>

using namespace geoalloc;
using namespace geoalloc::clustering;

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

static void BM_KMeans(benchmark::State& state) {
  const int n_points = state.range(0);
  const int k = state.range(1);

  const auto points = generate_points(n_points);
  const auto matrix = distance::compute(points, distance::GreatCircle{});
  auto partitioner = create_partitioner(KMeans{}, distance::GreatCircle{});

  for (auto _ : state) {
    auto result = partitioner->partition(points, matrix, k, 42);
    benchmark::DoNotOptimize(result);
  }

  state.SetLabel(std::to_string(n_points) + "p/" + std::to_string(k) + "k");
}

static void KMeansArgs(benchmark::internal::Benchmark* b) {
  for (int n : {100, 1000, 5000}) {
    for (int k : {2, 10, 50}) {
      b->Args({n, k});
    }
  }
  b->Unit(benchmark::kMillisecond);
}

BENCHMARK(BM_KMeans)->Apply(KMeansArgs);
