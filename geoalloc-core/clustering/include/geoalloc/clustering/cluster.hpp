#pragma once
#include <cstdint>
#include <geoalloc/common/types.hpp>
#include <geoalloc/distance/distance_matrix.hpp>
#include <geoalloc/distance/metric.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace geoalloc::clustering {

  // Lloyd iterations from `n_init` k-means++ starts drawn from the seed; the
  // lowest-inertia run wins. Balance between clusters is not enforced.
  struct KMeans {
    int max_iter = 300;
    int n_init = 10;
  };

  // Delegates to the external KaHIP `kaffpa` partitioner over a k-nearest
  // neighbour proximity graph.
  struct GraphPartition {
    int n_closest = 15;
    double imbalance = 0.03;
    bool balance_edges = false;
    std::string executable = "kaffpa";
    std::string preconfiguration = "strong";
    std::string work_dir;  // empty uses the system temp directory
  };

  using PartitionMethod = std::variant<KMeans, GraphPartition>;

  [[nodiscard]] std::string_view method_name(const PartitionMethod& method) noexcept;
  // "kmeans" or "kahip"; throws ValidationError otherwise.
  [[nodiscard]] PartitionMethod parse_method(std::string_view name);

  struct Cluster {
    int id = 0;
    std::vector<size_t> members;  // ascending point index
    std::optional<Coordinate> centroid;
  };

  struct ClusterResult {
    std::vector<int> labels;  // point index -> cluster id
    std::vector<Cluster> clusters;
    int iterations = 0;
    bool converged = true;
    std::optional<double> inertia;
    std::string method;
  };

  class IPartitioner {
  public:
    virtual ~IPartitioner() = default;

    [[nodiscard]] virtual ClusterResult partition(std::span<const Point> points,
                                                  const distance::DistanceMatrix& matrix, int k,
                                                  uint64_t seed)
        = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
  };

  class ProcessRunner;

  // `metric` gives k-means its point-to-centroid distance. `runner` overrides
  // how the graph partitioner is launched.
  [[nodiscard]] std::unique_ptr<IPartitioner> create_partitioner(
      const PartitionMethod& method, const distance::DistanceMetric& metric,
      std::shared_ptr<ProcessRunner> runner = nullptr);

  // Checks k and matrix shape. Throws ValidationError.
  void validate_partition_input(size_t n_points, const distance::DistanceMatrix& matrix, int k);

  // Builds clusters (members and mean coordinate) from labels in [0, k).
  [[nodiscard]] std::vector<Cluster> group_labels(std::span<const Point> points,
                                                  std::span<const int> labels, int k);

}  // namespace geoalloc::clustering
