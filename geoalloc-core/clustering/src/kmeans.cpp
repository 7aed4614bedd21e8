#include <fmt/format.h>

#include <Eigen/Dense>
#include <algorithm>
#include <geoalloc/clustering/kmeans.hpp>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/distance/geodesy.hpp>
#include <limits>
#include <random>

namespace geoalloc::clustering {

  namespace {

    using Coords = Eigen::Matrix<double, Eigen::Dynamic, 2, Eigen::RowMajor>;
    using DistanceFn = double (*)(Coordinate, Coordinate) noexcept;

    struct LloydRun {
      std::vector<int> labels;
      Coords centroids;
      int iterations = 0;
      bool converged = false;
      double inertia = 0.0;
    };

    Coordinate row_coordinate(const Coords& m, Eigen::Index r) { return {m(r, 0), m(r, 1)}; }

    // Centroids are not rows of the matrix, so distances to them come from the
    // closed-form metric. Road metrics fall back to great-circle.
    DistanceFn centroid_distance(const distance::DistanceMetric& metric) {
      if (std::holds_alternative<distance::Planar>(metric)) return &distance::planar_distance;
      if (distance::is_external(metric)) {
        logger()->debug("k-means uses great-circle distance to centroids for the {} metric",
                        distance::metric_name(metric));
      }
      return &distance::great_circle_distance;
    }

    // k-means++ seeding: each further seed is drawn with probability
    // proportional to its squared distance from the nearest chosen seed.
    std::vector<size_t> plus_plus_seeds(const Coords& points, size_t k, DistanceFn dist,
                                        std::mt19937_64& gen) {
      const auto n = static_cast<size_t>(points.rows());
      std::vector<size_t> seeds;
      std::vector<bool> chosen(n, false);
      std::vector<double> d2(n, 0.0);

      auto add_seed = [&](size_t s) {
        seeds.push_back(s);
        chosen[s] = true;
        const Coordinate c = row_coordinate(points, static_cast<Eigen::Index>(s));
        for (size_t i = 0; i < n; ++i) {
          const double d = dist(row_coordinate(points, static_cast<Eigen::Index>(i)), c);
          d2[i] = seeds.size() == 1 ? d * d : std::min(d2[i], d * d);
        }
      };

      add_seed(std::uniform_int_distribution<size_t>(0, n - 1)(gen));
      while (seeds.size() < k) {
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) {
          if (!chosen[i]) total += d2[i];
        }

        size_t pick = n;
        if (total > 0.0) {
          const double r = std::uniform_real_distribution<double>(0.0, total)(gen);
          double cumulative = 0.0;
          for (size_t i = 0; i < n; ++i) {
            if (chosen[i] || d2[i] <= 0.0) continue;
            cumulative += d2[i];
            pick = i;
            if (cumulative > r) break;
          }
        } else {
          // Every remaining point coincides with a seed.
          for (size_t i = 0; i < n && pick == n; ++i) {
            if (!chosen[i]) pick = i;
          }
        }
        add_seed(pick);
      }
      return seeds;
    }

    LloydRun lloyd(const Coords& points, std::span<const size_t> seeds, int max_iter,
                   DistanceFn dist) {
      const auto n = points.rows();
      const auto k = static_cast<Eigen::Index>(seeds.size());

      LloydRun run;
      run.labels.assign(static_cast<size_t>(n), -1);
      run.centroids.resize(k, 2);
      for (Eigen::Index c = 0; c < k; ++c) run.centroids.row(c) = points.row(seeds[c]);

      for (int iter = 1; iter <= max_iter; ++iter) {
        run.iterations = iter;

        bool changed = false;
        for (Eigen::Index i = 0; i < n; ++i) {
          const Coordinate p = row_coordinate(points, i);
          int best = 0;
          double best_dist = std::numeric_limits<double>::infinity();
          for (Eigen::Index c = 0; c < k; ++c) {
            const double d = dist(p, row_coordinate(run.centroids, c));
            if (d < best_dist) {
              best_dist = d;
              best = static_cast<int>(c);
            }
          }
          if (run.labels[i] != best) {
            run.labels[i] = best;
            changed = true;
          }
        }

        if (!changed) {
          run.converged = true;
          break;
        }

        Coords sums = Coords::Zero(k, 2);
        std::vector<int> counts(static_cast<size_t>(k), 0);
        for (Eigen::Index i = 0; i < n; ++i) {
          sums.row(run.labels[i]) += points.row(i);
          counts[run.labels[i]]++;
        }
        // An empty cluster keeps its previous centroid.
        for (Eigen::Index c = 0; c < k; ++c) {
          if (counts[c] > 0) run.centroids.row(c) = sums.row(c) / static_cast<double>(counts[c]);
        }
      }

      for (Eigen::Index i = 0; i < n; ++i) {
        const double d = dist(row_coordinate(points, i),
                              row_coordinate(run.centroids, run.labels[i]));
        run.inertia += d * d;
      }
      return run;
    }

  }  // namespace

  // =============================================================================
  // K-means Partitioner
  // =============================================================================

  KMeansPartitioner::KMeansPartitioner(KMeans params, distance::DistanceMetric metric)
      : params_(params), metric_(metric) {
    if (params_.max_iter < 1) {
      throw ValidationError(fmt::format("max_iter must be positive, got {}", params_.max_iter),
                            "max_iter");
    }
    if (params_.n_init < 1) {
      throw ValidationError(fmt::format("n_init must be positive, got {}", params_.n_init),
                            "n_init");
    }
  }

  ClusterResult KMeansPartitioner::partition(std::span<const Point> points,
                                             const distance::DistanceMatrix& matrix, int k,
                                             uint64_t seed) {
    GEOALLOC_ZONE;
    validate_partition_input(points.size(), matrix, k);

    const size_t n = points.size();
    Coords coords(static_cast<Eigen::Index>(n), 2);
    for (size_t i = 0; i < n; ++i) {
      coords(i, 0) = points[i].longitude;
      coords(i, 1) = points[i].latitude;
    }

    const DistanceFn dist = centroid_distance(metric_);
    std::mt19937_64 gen(seed);

    LloydRun best;
    best.inertia = std::numeric_limits<double>::infinity();
    for (int r = 0; r < params_.n_init; ++r) {
      const auto seeds = plus_plus_seeds(coords, static_cast<size_t>(k), dist, gen);
      auto run = lloyd(coords, seeds, params_.max_iter, dist);
      logger()->debug("k-means start {}: {} iterations, inertia {:.6g}", r, run.iterations,
                      run.inertia);
      if (run.inertia < best.inertia) best = std::move(run);
    }

    if (!best.converged) {
      logger()->warn("k-means did not converge within {} iterations", params_.max_iter);
    }

    ClusterResult result;
    result.clusters = group_labels(points, best.labels, k);
    for (auto& cluster : result.clusters) {
      cluster.centroid = row_coordinate(best.centroids, cluster.id);
    }
    result.labels = std::move(best.labels);
    result.iterations = best.iterations;
    result.converged = best.converged;
    result.inertia = best.inertia;
    result.method = "kmeans";
    return result;
  }

}  // namespace geoalloc::clustering
