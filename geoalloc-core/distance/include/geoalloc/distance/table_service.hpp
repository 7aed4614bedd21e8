#pragma once
#include <geoalloc/common/matrix.hpp>
#include <geoalloc/common/types.hpp>
#include <geoalloc/distance/chunking.hpp>
#include <geoalloc/distance/config.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace geoalloc::distance {

  // One answered table request. Unresolved cells are NaN.
  struct TableBlock {
    Matrix<double> distances;
    std::optional<Matrix<double>> durations;
  };

  // Wire format of a remote distance table API.
  class TableService {
  public:
    virtual ~TableService() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual TableLimits limits() const noexcept = 0;

    [[nodiscard]] virtual std::string request_url(std::span<const Coordinate> sources,
                                                  std::span<const Coordinate> destinations,
                                                  bool with_durations) const
        = 0;

    // Throws ExternalServiceError for service-level failures and malformed bodies.
    [[nodiscard]] virtual TableBlock parse_response(const std::string& body, size_t n_sources,
                                                    size_t n_destinations,
                                                    bool with_durations) const
        = 0;
  };

  [[nodiscard]] std::unique_ptr<TableService> make_osrm_table_service(
      const DistanceConfig& config);
  [[nodiscard]] std::unique_ptr<TableService> make_google_matrix_service(
      const DistanceConfig& config);

}  // namespace geoalloc::distance
