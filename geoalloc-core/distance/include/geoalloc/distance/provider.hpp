#pragma once
#include <geoalloc/common/matrix.hpp>
#include <geoalloc/common/types.hpp>
#include <geoalloc/distance/config.hpp>
#include <geoalloc/distance/distance_matrix.hpp>
#include <geoalloc/distance/http_client.hpp>
#include <geoalloc/distance/metric.hpp>
#include <memory>
#include <span>
#include <string_view>

namespace geoalloc::distance {

  struct TableResult {
    Matrix<double> distances;
    std::optional<Matrix<double>> durations;
  };

  // One implementation per metric. Unresolved cells come back as NaN and are
  // rejected by compute() / compute_cross().
  class IDistanceBackend {
  public:
    virtual ~IDistanceBackend() = default;

    [[nodiscard]] virtual TableResult square(std::span<const Coordinate> coords,
                                             bool with_durations)
        = 0;
    [[nodiscard]] virtual TableResult table(std::span<const Coordinate> sources,
                                            std::span<const Coordinate> destinations,
                                            bool with_durations)
        = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
  };

  // A null `http` creates the libcurl client for external metrics.
  [[nodiscard]] std::unique_ptr<IDistanceBackend> create_backend(
      const DistanceMetric& metric, const DistanceConfig& config = {},
      std::shared_ptr<HttpClient> http = nullptr);

  // Pairwise distances between `points`. Validates coordinates and credentials
  // before any computation and fails if any cell stays unresolved.
  [[nodiscard]] DistanceMatrix compute(std::span<const Point> points, const DistanceMetric& metric,
                                       const DistanceConfig& config = {},
                                       std::shared_ptr<HttpClient> http = nullptr);

  // points x workers distances.
  [[nodiscard]] Matrix<double> compute_cross(std::span<const Point> points,
                                             std::span<const Worker> workers,
                                             const DistanceMetric& metric,
                                             const DistanceConfig& config = {},
                                             std::shared_ptr<HttpClient> http = nullptr);

}  // namespace geoalloc::distance
