#pragma once
#include <geoalloc/clustering/cluster.hpp>

namespace geoalloc::clustering {

  class KMeansPartitioner : public IPartitioner {
  public:
    KMeansPartitioner(KMeans params, distance::DistanceMetric metric);

    [[nodiscard]] ClusterResult partition(std::span<const Point> points,
                                          const distance::DistanceMatrix& matrix, int k,
                                          uint64_t seed) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "kmeans"; }

  private:
    KMeans params_;
    distance::DistanceMetric metric_;
  };

}  // namespace geoalloc::clustering
