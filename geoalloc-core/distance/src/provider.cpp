#include <fmt/format.h>

#include <chrono>
#include <cmath>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/common/overloaded.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/distance/geodesy.hpp>
#include <geoalloc/distance/provider.hpp>
#include <geoalloc/distance/request_pool.hpp>
#include <geoalloc/distance/retry.hpp>
#include <geoalloc/distance/table_service.hpp>
#include <limits>
#include <vector>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace geoalloc::distance {

  namespace {

    using DistanceFn = double (*)(Coordinate, Coordinate) noexcept;

    template <typename Item> std::vector<Coordinate> coordinates(std::span<const Item> items) {
      std::vector<Coordinate> out;
      out.reserve(items.size());
      for (const auto& item : items) out.push_back(coordinate_of(item));
      return out;
    }

    template <typename Item>
    void validate_coordinates(std::span<const Item> items, const DistanceMetric& metric) {
      const bool geographic = !std::holds_alternative<Planar>(metric);
      for (const auto& item : items) {
        if (!std::isfinite(item.longitude) || !std::isfinite(item.latitude)) {
          throw ValidationError(fmt::format("malformed coordinates for '{}'", item.id), item.id);
        }
        if (geographic && (std::abs(item.latitude) > 90.0 || std::abs(item.longitude) > 180.0)) {
          throw ValidationError(fmt::format("coordinates out of range for '{}': ({}, {})",
                                            item.id, item.longitude, item.latitude),
                                item.id);
        }
      }
    }

    void validate_request(const DistanceMetric& metric, const DistanceConfig& config) {
      config.validate();
      if (std::holds_alternative<ExternalMapping>(metric) && config.api_key.empty()) {
        throw ValidationError("external-mapping metric requires an API key", "api_key");
      }
      if (config.with_durations && !is_external(metric)) {
        throw ValidationError(
            fmt::format("durations are not available for the {} metric", metric_name(metric)),
            "with_durations");
      }
    }

    // No silent zero-fill: any NaN or negative cell fails the whole call.
    template <typename Src, typename Dst>
    void require_resolved(const Matrix<double>& m, std::span<const Src> sources,
                          std::span<const Dst> destinations, std::string_view service) {
      for (size_t i = 0; i < m.rows(); ++i) {
        for (size_t j = 0; j < m.cols(); ++j) {
          const double v = m(i, j);
          if (std::isnan(v) || v < 0.0) {
            throw ExternalServiceError(std::string(service),
                                       fmt::format("no route resolved from '{}' to '{}'",
                                                   sources[i].id, destinations[j].id),
                                       0, false, sources[i].id);
          }
        }
      }
    }

  }  // namespace

  // =============================================================================
  // Geometric Backends
  // =============================================================================

  class GeometricBackend : public IDistanceBackend {
  public:
    GeometricBackend(DistanceFn fn, std::string_view name) : fn_(fn), name_(name) {}

    // Upper triangle mirrored, so symmetry is exact.
    [[nodiscard]] TableResult square(std::span<const Coordinate> coords, bool) override {
      GEOALLOC_ZONE;
      const auto n = static_cast<long>(coords.size());
      TableResult result{Matrix<double>(coords.size(), coords.size(), 0.0), std::nullopt};
      auto& m = result.distances;

#ifdef _OPENMP
#  pragma omp parallel for schedule(dynamic, 16) if (n > 256)
#endif
      for (long i = 0; i < n; ++i) {
        for (long j = i + 1; j < n; ++j) {
          const double d = fn_(coords[i], coords[j]);
          m(i, j) = d;
          m(j, i) = d;
        }
      }
      return result;
    }

    [[nodiscard]] TableResult table(std::span<const Coordinate> sources,
                                    std::span<const Coordinate> destinations, bool) override {
      GEOALLOC_ZONE;
      const auto ns = static_cast<long>(sources.size());
      TableResult result{Matrix<double>(sources.size(), destinations.size()), std::nullopt};
      auto& m = result.distances;

#ifdef _OPENMP
#  pragma omp parallel for schedule(static) if (ns > 256)
#endif
      for (long i = 0; i < ns; ++i) {
        for (size_t j = 0; j < destinations.size(); ++j) {
          m(i, j) = fn_(sources[i], destinations[j]);
        }
      }
      return result;
    }

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

  private:
    DistanceFn fn_;
    std::string_view name_;
  };

  // =============================================================================
  // External Table Backend
  // =============================================================================

  class ExternalTableBackend : public IDistanceBackend {
  public:
    ExternalTableBackend(std::unique_ptr<TableService> service, DistanceConfig config,
                         std::shared_ptr<HttpClient> http)
        : service_(std::move(service)), config_(std::move(config)), http_(std::move(http)) {}

    [[nodiscard]] TableResult square(std::span<const Coordinate> coords,
                                     bool with_durations) override {
      auto result = table(coords, coords, with_durations);
      // A point is always zero away from itself, whatever the service snapped it to.
      for (size_t i = 0; i < coords.size(); ++i) {
        result.distances(i, i) = 0.0;
        if (result.durations) (*result.durations)(i, i) = 0.0;
      }
      return result;
    }

    [[nodiscard]] TableResult table(std::span<const Coordinate> sources,
                                    std::span<const Coordinate> destinations,
                                    bool with_durations) override {
      GEOALLOC_ZONE;
      constexpr double unresolved = std::numeric_limits<double>::quiet_NaN();
      const size_t ns = sources.size();
      const size_t nd = destinations.size();

      TableResult result{Matrix<double>(ns, nd, unresolved), std::nullopt};
      if (with_durations) result.durations.emplace(ns, nd, unresolved);

      const auto chunks = plan_chunks(ns, nd, service_->limits());
      logger()->debug("{}: {}x{} table in {} requests, {} in flight", service_->name(), ns, nd,
                      chunks.size(), config_.max_in_flight);

      const std::chrono::milliseconds timeout(config_.timeout_ms);
      run_bounded(chunks.size(), static_cast<size_t>(config_.max_in_flight),
                  [&](size_t idx, const std::atomic<bool>& cancelled) {
                    const auto& c = chunks[idx];
                    auto block = with_retry(config_.retry, cancelled, [&] {
                      const auto url
                          = service_->request_url(sources.subspan(c.src_begin, c.sources()),
                                                  destinations.subspan(c.dst_begin, c.destinations()),
                                                  with_durations);
                      const auto response = http_->get(url, timeout);
                      check_http_status(service_->name(), response);
                      return service_->parse_response(response.body, c.sources(), c.destinations(),
                                                      with_durations);
                    });

                    // Chunks never overlap, so workers write disjoint cells.
                    for (size_t i = 0; i < c.sources(); ++i) {
                      for (size_t j = 0; j < c.destinations(); ++j) {
                        result.distances(c.src_begin + i, c.dst_begin + j) = block.distances(i, j);
                        if (with_durations) {
                          (*result.durations)(c.src_begin + i, c.dst_begin + j)
                              = (*block.durations)(i, j);
                        }
                      }
                    }
                  });
      return result;
    }

    [[nodiscard]] std::string_view name() const noexcept override { return service_->name(); }

  private:
    std::unique_ptr<TableService> service_;
    DistanceConfig config_;
    std::shared_ptr<HttpClient> http_;
  };

  // =============================================================================
  // Factory Functions
  // =============================================================================

  std::unique_ptr<IDistanceBackend> create_backend(const DistanceMetric& metric,
                                                   const DistanceConfig& config,
                                                   std::shared_ptr<HttpClient> http) {
    auto client = [&]() {
      return http ? http : create_http_client();
    };
    return std::visit(
        overloaded{[](Planar) -> std::unique_ptr<IDistanceBackend> {
                     return std::make_unique<GeometricBackend>(&planar_distance, "planar");
                   },
                   [](GreatCircle) -> std::unique_ptr<IDistanceBackend> {
                     return std::make_unique<GeometricBackend>(&great_circle_distance,
                                                               "great-circle");
                   },
                   [&](ExternalRouting) -> std::unique_ptr<IDistanceBackend> {
                     return std::make_unique<ExternalTableBackend>(
                         make_osrm_table_service(config), config, client());
                   },
                   [&](ExternalMapping) -> std::unique_ptr<IDistanceBackend> {
                     return std::make_unique<ExternalTableBackend>(
                         make_google_matrix_service(config), config, client());
                   }},
        metric);
  }

  // =============================================================================
  // Public API
  // =============================================================================

  DistanceMatrix compute(std::span<const Point> points, const DistanceMetric& metric,
                         const DistanceConfig& config, std::shared_ptr<HttpClient> http) {
    GEOALLOC_ZONE;
    validate_request(metric, config);
    validate_coordinates(points, metric);

    auto backend = create_backend(metric, config, std::move(http));
    const auto coords = coordinates(points);
    auto table = backend->square(coords, config.with_durations);

    require_resolved(table.distances, points, points, backend->name());
    if (table.durations) require_resolved(*table.durations, points, points, backend->name());

    logger()->debug("computed {}x{} {} distance matrix", points.size(), points.size(),
                    metric_name(metric));
    DistanceMatrix matrix{std::move(table.distances), std::move(table.durations),
                          is_symmetric(metric)};
    matrix.validate();
    return matrix;
  }

  Matrix<double> compute_cross(std::span<const Point> points, std::span<const Worker> workers,
                               const DistanceMetric& metric, const DistanceConfig& config,
                               std::shared_ptr<HttpClient> http) {
    GEOALLOC_ZONE;
    DistanceConfig cross_config = config;
    cross_config.with_durations = false;
    validate_request(metric, cross_config);
    validate_coordinates(points, metric);
    validate_coordinates(workers, metric);

    auto backend = create_backend(metric, cross_config, std::move(http));
    const auto from = coordinates(points);
    const auto to = coordinates(workers);
    auto table = backend->table(from, to, false);

    require_resolved(table.distances, points, workers, backend->name());
    return std::move(table.distances);
  }

}  // namespace geoalloc::distance
