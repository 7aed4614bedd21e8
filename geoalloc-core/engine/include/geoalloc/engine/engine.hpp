#pragma once
#include <expected>
#include <geoalloc/clustering/graph_partition.hpp>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/http_client.hpp>
#include <geoalloc/engine/config.hpp>
#include <geoalloc/io/report.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geoalloc::engine {

  struct EngineError {
    ErrorKind kind = ErrorKind::internal;
    std::string message;
    std::string subject;
  };

  // Replaceable collaborators. Empty members use the real implementations.
  struct Services {
    std::shared_ptr<distance::HttpClient> http;
    std::shared_ptr<clustering::ProcessRunner> runner;
  };

  // Stateless between calls: every call recomputes its distance matrix.
  class Engine {
  public:
    [[nodiscard]] static std::expected<Engine, EngineError> create(EngineConfig config,
                                                                   Services services
                                                                   = {}) noexcept;
    [[nodiscard]] static std::expected<Engine, EngineError> from_file(
        const std::string& path) noexcept;
    [[nodiscard]] static std::expected<Engine, EngineError> from_json_string(
        const std::string& json_str) noexcept;

    Engine(Engine&&) = default;
    Engine& operator=(Engine&&) = default;
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // One row per point in input order, with its cluster id.
    [[nodiscard]] std::expected<io::Report, EngineError> cluster(
        std::vector<Point> points) const noexcept;

    // One row per point in visiting order. `start` is a point id and
    // overrides the configured start.
    [[nodiscard]] std::expected<io::Report, EngineError> route(
        std::vector<Point> points, std::optional<std::string> start = std::nullopt) const noexcept;

    // Clusters, then routes every cluster on its own sub-matrix. Rows are
    // grouped by cluster in visiting order.
    [[nodiscard]] std::expected<io::Report, EngineError> cluster_and_route(
        std::vector<Point> points) const noexcept;

    // One row per point (point_order) or per point and worker (ranking).
    [[nodiscard]] std::expected<io::Report, EngineError> assign(
        std::vector<Point> points, std::vector<Worker> workers) const noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

  private:
    Engine(EngineConfig config, Services services);

    EngineConfig config_;
    Services services_;
  };

}  // namespace geoalloc::engine
