#include <algorithm>
#include <cmath>
#include <geoalloc/clustering/stats.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/distance/spanning_tree.hpp>

namespace geoalloc::clustering {

  namespace {

    double max_over_mean(const std::vector<double>& values) {
      if (values.empty()) return 0.0;
      double sum = 0.0;
      for (double v : values) sum += v;
      const double mean = sum / static_cast<double>(values.size());
      if (mean <= 0.0) return 0.0;
      return *std::max_element(values.begin(), values.end()) / mean;
    }

  }  // namespace

  BalanceSummary summarize(const ClusterResult& result, const distance::DistanceMatrix& matrix) {
    GEOALLOC_ZONE;
    BalanceSummary summary;
    std::vector<double> sizes;
    std::vector<double> msts;

    for (const auto& cluster : result.clusters) {
      ClusterStats stats;
      stats.cluster_id = cluster.id;
      stats.size = cluster.members.size();

      const auto sub = matrix.subset(cluster.members);
      for (size_t a = 0; a < sub.size(); ++a) {
        for (size_t b = a + 1; b < sub.size(); ++b) {
          stats.graph_weight += distance::edge_weight(sub, a, b);
        }
      }
      stats.mst_weight = distance::minimum_spanning_tree(sub).weight;

      sizes.push_back(static_cast<double>(stats.size));
      msts.push_back(stats.mst_weight);
      summary.clusters.push_back(stats);
    }

    summary.size_imbalance = max_over_mean(sizes);
    summary.mst_imbalance = max_over_mean(msts);
    if (!sizes.empty()) {
      double mean = 0.0;
      for (double s : sizes) mean += s;
      mean /= static_cast<double>(sizes.size());
      double var = 0.0;
      for (double s : sizes) var += (s - mean) * (s - mean);
      var /= static_cast<double>(sizes.size());
      summary.size_cv = mean > 0.0 ? std::sqrt(var) / mean : 0.0;
    }
    return summary;
  }

}  // namespace geoalloc::clustering
