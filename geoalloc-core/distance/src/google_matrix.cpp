#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/table_service.hpp>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>

namespace geoalloc::distance {

  using json = nlohmann::json;

  namespace {

    // Per-request limits of the standard Distance Matrix plan.
    constexpr size_t kMaxOrigins = 25;
    constexpr size_t kMaxDestinations = 25;
    constexpr size_t kMaxElements = 100;

    constexpr std::array<std::string_view, 2> kTransientStatus{"OVER_QUERY_LIMIT",
                                                               "UNKNOWN_ERROR"};

    std::string join_locations(std::span<const Coordinate> coords) {
      std::string out;
      for (const auto& c : coords) {
        if (!out.empty()) out += "%7C";
        out += fmt::format("{:.6f},{:.6f}", c.latitude, c.longitude);
      }
      return out;
    }

  }  // namespace

  // =============================================================================
  // Google Distance Matrix API
  // =============================================================================

  class GoogleMatrixService : public TableService {
  public:
    explicit GoogleMatrixService(const DistanceConfig& config)
        : base_url_(config.base_url.empty() ? DEFAULT_MAPS_URL : config.base_url),
          api_key_(config.api_key) {}

    [[nodiscard]] std::string_view name() const noexcept override { return "google"; }

    [[nodiscard]] TableLimits limits() const noexcept override {
      return {kMaxOrigins, kMaxDestinations, kMaxElements};
    }

    [[nodiscard]] std::string request_url(std::span<const Coordinate> sources,
                                          std::span<const Coordinate> destinations,
                                          bool /*with_durations*/) const override {
      return fmt::format("{}/maps/api/distancematrix/json?origins={}&destinations={}&key={}",
                         base_url_, join_locations(sources), join_locations(destinations),
                         api_key_);
    }

    [[nodiscard]] TableBlock parse_response(const std::string& body, size_t n_sources,
                                            size_t n_destinations,
                                            bool with_durations) const override {
      json j = json::parse(body, nullptr, false);
      if (j.is_discarded() || !j.is_object()) {
        throw ExternalServiceError("google", "malformed response body", 0, false);
      }

      const std::string status = j.value("status", "");
      if (status != "OK") {
        const bool transient = std::find(kTransientStatus.begin(), kTransientStatus.end(), status)
                               != kTransientStatus.end();
        throw ExternalServiceError("google",
                                   fmt::format("{}: {}", status, j.value("error_message", "")),
                                   0, transient);
      }

      const auto& rows = j.value("rows", json::array());
      if (rows.size() != n_sources) {
        throw ExternalServiceError("google", "response has wrong row count", 0, false);
      }

      constexpr double unresolved = std::numeric_limits<double>::quiet_NaN();
      TableBlock block{Matrix<double>(n_sources, n_destinations, unresolved), std::nullopt};
      if (with_durations) block.durations.emplace(n_sources, n_destinations, unresolved);

      for (size_t i = 0; i < n_sources; ++i) {
        const auto& elements = rows[i].value("elements", json::array());
        if (elements.size() != n_destinations) {
          throw ExternalServiceError("google", fmt::format("row {} has wrong length", i), 0,
                                     false);
        }
        for (size_t k = 0; k < n_destinations; ++k) {
          const auto& e = elements[k];
          if (e.value("status", "") != "OK" || !e.contains("distance")) continue;
          block.distances(i, k) = e["distance"].value("value", unresolved);
          if (with_durations && e.contains("duration")) {
            (*block.durations)(i, k) = e["duration"].value("value", unresolved);
          }
        }
      }
      return block;
    }

  private:
    std::string base_url_;
    std::string api_key_;
  };

  std::unique_ptr<TableService> make_google_matrix_service(const DistanceConfig& config) {
    return std::make_unique<GoogleMatrixService>(config);
  }

}  // namespace geoalloc::distance
