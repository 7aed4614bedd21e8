#pragma once
#include <geoalloc/clustering/cluster.hpp>
#include <vector>

namespace geoalloc::clustering {

  struct ClusterStats {
    int cluster_id = 0;
    size_t size = 0;
    double graph_weight = 0.0;  // sum of distances over all member pairs
    double mst_weight = 0.0;
  };

  // Observational balance summary; never feeds back into partitioning.
  struct BalanceSummary {
    std::vector<ClusterStats> clusters;
    double size_imbalance = 0.0;  // largest size / mean size
    double size_cv = 0.0;         // coefficient of variation of sizes
    double mst_imbalance = 0.0;   // largest MST weight / mean MST weight
  };

  [[nodiscard]] BalanceSummary summarize(const ClusterResult& result,
                                         const distance::DistanceMatrix& matrix);

}  // namespace geoalloc::clustering
