#include <fmt/format.h>

#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/table_service.hpp>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>

namespace geoalloc::distance {

  using json = nlohmann::json;

  namespace {

    constexpr double kUnresolved = std::numeric_limits<double>::quiet_NaN();

    Matrix<double> read_table(const json& rows, size_t n_sources, size_t n_destinations,
                              std::string_view field) {
      if (!rows.is_array() || rows.size() != n_sources) {
        throw ExternalServiceError("osrm", fmt::format("'{}' has wrong row count", field), 0,
                                   false);
      }
      Matrix<double> out(n_sources, n_destinations, kUnresolved);
      for (size_t i = 0; i < n_sources; ++i) {
        const auto& row = rows[i];
        if (!row.is_array() || row.size() != n_destinations) {
          throw ExternalServiceError("osrm", fmt::format("'{}' row {} has wrong length", field, i),
                                     0, false);
        }
        for (size_t j = 0; j < n_destinations; ++j) {
          if (row[j].is_number()) out(i, j) = row[j].get<double>();
        }
      }
      return out;
    }

  }  // namespace

  // =============================================================================
  // OSRM table API
  // =============================================================================

  class OsrmTableService : public TableService {
  public:
    explicit OsrmTableService(const DistanceConfig& config)
        : base_url_(config.base_url.empty() ? DEFAULT_OSRM_URL : config.base_url),
          side_(static_cast<size_t>(config.max_table_size)) {}

    [[nodiscard]] std::string_view name() const noexcept override { return "osrm"; }

    [[nodiscard]] TableLimits limits() const noexcept override {
      return {side_, side_, side_ * side_};
    }

    [[nodiscard]] std::string request_url(std::span<const Coordinate> sources,
                                          std::span<const Coordinate> destinations,
                                          bool with_durations) const override {
      std::string coords;
      std::string src_idx;
      std::string dst_idx;
      size_t k = 0;
      for (const auto& c : sources) {
        if (k > 0) coords += ';';
        coords += fmt::format("{:.6f},{:.6f}", c.longitude, c.latitude);
        if (!src_idx.empty()) src_idx += ';';
        src_idx += std::to_string(k++);
      }
      for (const auto& c : destinations) {
        coords += fmt::format(";{:.6f},{:.6f}", c.longitude, c.latitude);
        if (!dst_idx.empty()) dst_idx += ';';
        dst_idx += std::to_string(k++);
      }
      return fmt::format("{}/table/v1/driving/{}?sources={}&destinations={}&annotations={}",
                         base_url_, coords, src_idx, dst_idx,
                         with_durations ? "distance,duration" : "distance");
    }

    [[nodiscard]] TableBlock parse_response(const std::string& body, size_t n_sources,
                                            size_t n_destinations,
                                            bool with_durations) const override {
      json j = json::parse(body, nullptr, false);
      if (j.is_discarded() || !j.is_object()) {
        throw ExternalServiceError("osrm", "malformed response body", 0, false);
      }
      const std::string code = j.value("code", "");
      if (code != "Ok") {
        throw ExternalServiceError("osrm",
                                   fmt::format("{}: {}", code, j.value("message", "no message")),
                                   0, false);
      }
      if (!j.contains("distances")) {
        throw ExternalServiceError("osrm", "response has no 'distances'", 0, false);
      }

      TableBlock block{read_table(j["distances"], n_sources, n_destinations, "distances"),
                       std::nullopt};
      if (with_durations) {
        if (!j.contains("durations")) {
          throw ExternalServiceError("osrm", "response has no 'durations'", 0, false);
        }
        block.durations = read_table(j["durations"], n_sources, n_destinations, "durations");
      }
      return block;
    }

  private:
    std::string base_url_;
    size_t side_;
  };

  std::unique_ptr<TableService> make_osrm_table_service(const DistanceConfig& config) {
    return std::make_unique<OsrmTableService>(config);
  }

}  // namespace geoalloc::distance
