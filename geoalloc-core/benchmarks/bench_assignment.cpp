#include <benchmark/benchmark.h>

#include <geoalloc/assignment/assignment.hpp>
#include <geoalloc/distance/provider.hpp>
#include <random>
#include <string>
#include <vector>

using namespace geoalloc;

static void BM_Assign_Bounded(benchmark::State& state) {
  const int n_points = state.range(0);
  const int n_workers = state.range(1);

  std::mt19937 rng(42);
  std::uniform_real_distribution<double> lon(100.3, 100.7);
  std::uniform_real_distribution<double> lat(13.5, 13.9);
  std::vector<Point> points(n_points);
  for (int i = 0; i < n_points; ++i) points[i] = {std::to_string(i), lon(rng), lat(rng), {}};
  std::vector<Worker> workers(n_workers);
  const int capacity = (n_points + n_workers - 1) / n_workers;
  for (int w = 0; w < n_workers; ++w) {
    workers[w] = {"w" + std::to_string(w), lon(rng), lat(rng), capacity};
  }

  const auto distances = distance::compute_cross(points, workers, distance::GreatCircle{});

  for (auto _ : state) {
    auto result = assignment::assign(points, workers, distances);
    benchmark::DoNotOptimize(result);
  }

  state.SetItemsProcessed(state.iterations() * n_points);
  state.SetLabel(std::to_string(n_points) + "p/" + std::to_string(n_workers) + "w");
}

static void AssignArgs(benchmark::internal::Benchmark* b) {
  for (int n : {100, 1000, 10000}) {
    for (int w : {5, 50}) {
      b->Args({n, w});
    }
  }
  b->Unit(benchmark::kMicrosecond);
}

BENCHMARK(BM_Assign_Bounded)->Apply(AssignArgs);
