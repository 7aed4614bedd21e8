#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/distance/retry.hpp>
#include <nlohmann/json.hpp>
#include <numeric>

#include "solvers.hpp"

namespace geoalloc::routing {

  using json = nlohmann::json;

  namespace {

    constexpr std::string_view kService = "osrm-trip";

    [[noreturn]] void malformed(const std::string& what) {
      throw ExternalServiceError(std::string(kService), what, 0, false);
    }

    // Position of each requested coordinate in the returned trip.
    std::vector<size_t> read_waypoint_positions(const std::string& body, size_t n) {
      json j = json::parse(body, nullptr, false);
      if (j.is_discarded() || !j.is_object()) malformed("malformed response body");
      const std::string code = j.value("code", "");
      if (code != "Ok") malformed(fmt::format("{}: {}", code, j.value("message", "no message")));

      const auto it = j.find("waypoints");
      if (it == j.end() || !it->is_array() || it->size() != n) {
        malformed("response has wrong waypoint count");
      }
      std::vector<size_t> positions;
      positions.reserve(n);
      for (const auto& wp : *it) {
        if (wp.value("trips_index", 0) != 0) malformed("trip split into several pieces");
        const auto pos = wp.value("waypoint_index", -1);
        if (pos < 0 || static_cast<size_t>(pos) >= n) malformed("waypoint index out of range");
        positions.push_back(static_cast<size_t>(pos));
      }
      return positions;
    }

  }  // namespace

  // =============================================================================
  // OSRM Trip Service
  // =============================================================================

  class TripServiceSolver : public IRouteSolver {
  public:
    TripServiceSolver(distance::DistanceConfig config, std::shared_ptr<distance::HttpClient> http)
        : config_(std::move(config)), http_(std::move(http)) {
      if (config_.base_url.empty()) config_.base_url = distance::DEFAULT_OSRM_URL;
    }

    [[nodiscard]] Route solve(std::span<const Point> points,
                              const distance::DistanceMatrix& matrix,
                              const RouteOptions& options) override {
      GEOALLOC_ZONE;
      validate_route_input(points, matrix, options);
      const size_t n = points.size();
      if (n > TRIP_SERVICE_MAX_POINTS) [[unlikely]] {
        throw ValidationError(fmt::format("trip service accepts at most {} points, got {}",
                                          TRIP_SERVICE_MAX_POINTS, n),
                              "points");
      }
      if (auto order = trivial_order(n, options.start)) {
        return finalize_route(std::move(*order), matrix, options, name());
      }

      // The service always starts from the first coordinate, so the fixed
      // start is moved to the front.
      const size_t start = options.start.value_or(0);
      std::vector<size_t> request(n);
      std::iota(request.begin(), request.end(), size_t{0});
      std::rotate(request.begin(), request.begin() + static_cast<std::ptrdiff_t>(start),
                  request.end());

      const std::string url = request_url(points, request);
      const std::atomic<bool> never_cancelled{false};
      const auto positions = distance::with_retry(config_.retry, never_cancelled, [&] {
        const auto response = http_->get(url, std::chrono::milliseconds(config_.timeout_ms));
        distance::check_http_status(kService, response);
        return read_waypoint_positions(response.body, n);
      });

      std::vector<size_t> order(n, n);
      for (size_t k = 0; k < n; ++k) {
        if (order[positions[k]] != n) malformed("duplicate waypoint index");
        order[positions[k]] = request[k];
      }
      return finalize_route(std::move(order), matrix, options, name());
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "trip"; }

  private:
    [[nodiscard]] std::string request_url(std::span<const Point> points,
                                          const std::vector<size_t>& request) const {
      std::string coords;
      for (size_t idx : request) {
        if (!coords.empty()) coords += ';';
        coords += fmt::format("{:.6f},{:.6f}", points[idx].longitude, points[idx].latitude);
      }
      return fmt::format("{}/trip/v1/driving/{}?roundtrip=true&source=first&overview=false",
                         config_.base_url, coords);
    }

    distance::DistanceConfig config_;
    std::shared_ptr<distance::HttpClient> http_;
  };

  std::unique_ptr<IRouteSolver> make_trip_service_solver(
      const distance::DistanceConfig& config, std::shared_ptr<distance::HttpClient> http) {
    config.validate();
    if (!http) http = distance::create_http_client();
    return std::make_unique<TripServiceSolver>(config, std::move(http));
  }

}  // namespace geoalloc::routing
