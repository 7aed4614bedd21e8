#include <fmt/format.h>

#include <geoalloc/clustering/cluster.hpp>
#include <geoalloc/clustering/graph_partition.hpp>
#include <geoalloc/clustering/kmeans.hpp>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/overloaded.hpp>

namespace geoalloc::clustering {

  std::string_view method_name(const PartitionMethod& method) noexcept {
    return std::visit(overloaded{[](const KMeans&) -> std::string_view { return "kmeans"; },
                                 [](const GraphPartition&) -> std::string_view { return "kahip"; }},
                      method);
  }

  PartitionMethod parse_method(std::string_view name) {
    if (name == "kmeans") return KMeans{};
    if (name == "kahip") return GraphPartition{};
    throw ValidationError(fmt::format("unknown clustering method '{}'", name), "method");
  }

  void validate_partition_input(size_t n_points, const distance::DistanceMatrix& matrix, int k) {
    if (k <= 0 || static_cast<size_t>(k) > n_points) [[unlikely]] {
      throw ValidationError(fmt::format("k must be in [1, {}], got {}", n_points, k), "k");
    }
    if (matrix.size() != n_points || !matrix.distances.square()) [[unlikely]] {
      throw ValidationError(fmt::format("distance matrix is {}x{} for {} points",
                                        matrix.distances.rows(), matrix.distances.cols(),
                                        n_points));
    }
    matrix.validate();
  }

  std::vector<Cluster> group_labels(std::span<const Point> points, std::span<const int> labels,
                                    int k) {
    std::vector<Cluster> clusters(static_cast<size_t>(k));
    for (int c = 0; c < k; ++c) clusters[c].id = c;

    for (size_t i = 0; i < labels.size(); ++i) {
      clusters[static_cast<size_t>(labels[i])].members.push_back(i);
    }
    for (auto& cluster : clusters) {
      if (cluster.members.empty()) continue;
      Coordinate sum{};
      for (size_t i : cluster.members) {
        sum.longitude += points[i].longitude;
        sum.latitude += points[i].latitude;
      }
      const auto count = static_cast<double>(cluster.members.size());
      cluster.centroid = Coordinate{sum.longitude / count, sum.latitude / count};
    }
    return clusters;
  }

  // =============================================================================
  // Factory Functions
  // =============================================================================

  std::unique_ptr<IPartitioner> create_partitioner(const PartitionMethod& method,
                                                   const distance::DistanceMetric& metric,
                                                   std::shared_ptr<ProcessRunner> runner) {
    return std::visit(
        overloaded{[&](const KMeans& params) -> std::unique_ptr<IPartitioner> {
                     return std::make_unique<KMeansPartitioner>(params, metric);
                   },
                   [&](const GraphPartition& params) -> std::unique_ptr<IPartitioner> {
                     if (!runner) runner = std::make_shared<SubprocessRunner>();
                     return std::make_unique<GraphPartitioner>(params, runner);
                   }},
        method);
  }

}  // namespace geoalloc::clustering
