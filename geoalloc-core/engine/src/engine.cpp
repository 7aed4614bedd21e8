#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <geoalloc/clustering/stats.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/common/overloaded.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/distance/provider.hpp>
#include <geoalloc/engine/engine.hpp>

namespace geoalloc::engine {

  namespace {

    using Clock = std::chrono::steady_clock;

    double elapsed_ms(Clock::time_point since) {
      return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
    }

    // Runs one facade call, turning exceptions into EngineError.
    template <typename Fn>
    auto guarded(std::string_view what, Fn&& fn) noexcept
        -> std::expected<decltype(fn()), EngineError> {
      try {
        return fn();
      } catch (const Error& e) {
        logger()->debug("{} failed ({}): {}", what, to_string(e.kind()), e.what());
        return std::unexpected(EngineError{e.kind(), e.what(), e.subject()});
      } catch (const std::exception& e) {
        logger()->debug("{} failed: {}", what, e.what());
        return std::unexpected(EngineError{ErrorKind::internal, e.what(), {}});
      }
    }

    size_t index_of(std::span<const Point> points, const std::string& id) {
      const auto it
          = std::find_if(points.begin(), points.end(), [&](const Point& p) { return p.id == id; });
      if (it == points.end()) {
        throw ValidationError(fmt::format("start point '{}' is not in the input", id), id);
      }
      return static_cast<size_t>(it - points.begin());
    }

    io::Metadata metadata_for(std::string stage, std::string method, const EngineConfig& config) {
      io::Metadata m;
      m.stage = std::move(stage);
      m.method = std::move(method);
      m.metric = std::string(distance::metric_name(config.distance.metric));
      return m;
    }

  }  // namespace

  Engine::Engine(EngineConfig config, Services services)
      : config_(std::move(config)), services_(std::move(services)) {}

  std::expected<Engine, EngineError> Engine::create(EngineConfig config,
                                                    Services services) noexcept {
    return guarded("engine setup", [&] {
      config.resolve_api_key();
      config.validate();
      set_log_level(config.log_level);
      return Engine(std::move(config), std::move(services));
    });
  }

  std::expected<Engine, EngineError> Engine::from_file(const std::string& path) noexcept {
    auto config = guarded("config load", [&] { return EngineConfig::from_json(path); });
    if (!config) return std::unexpected(config.error());
    return create(std::move(*config));
  }

  std::expected<Engine, EngineError> Engine::from_json_string(const std::string& json_str) noexcept {
    auto config = guarded("config load", [&] { return EngineConfig::from_json_string(json_str); });
    if (!config) return std::unexpected(config.error());
    return create(std::move(*config));
  }

  // ===========================================================================
  // Clustering
  // ===========================================================================

  std::expected<io::Report, EngineError> Engine::cluster(std::vector<Point> points) const noexcept {
    return guarded("cluster", [&] {
      GEOALLOC_ZONE;
      const auto started = Clock::now();
      const auto& cc = config_.clustering;
      const auto matrix = distance::compute(points, config_.distance.metric,
                                            config_.distance.config, services_.http);
      auto partitioner
          = clustering::create_partitioner(cc.method, config_.distance.metric, services_.runner);
      const auto result = partitioner->partition(points, matrix, cc.k, cc.seed);

      io::Report report;
      report.metadata = metadata_for("cluster", result.method, config_);
      report.metadata.iterations = result.iterations;
      report.metadata.converged = result.converged;
      report.metadata.seed = cc.seed;
      report.metadata.inertia = result.inertia;
      report.metadata.balance = clustering::summarize(result, matrix);
      report.rows.reserve(points.size());
      for (size_t i = 0; i < points.size(); ++i) {
        io::OutputRow row;
        row.point = i;
        row.cluster = result.labels[i];
        report.rows.push_back(std::move(row));
      }
      report.points = std::move(points);
      report.metadata.elapsed_ms = elapsed_ms(started);
      logger()->info("clustered {} points into {} clusters in {:.1f} ms", report.points.size(),
                     cc.k, report.metadata.elapsed_ms);
      return report;
    });
  }

  // ===========================================================================
  // Routing
  // ===========================================================================

  std::expected<io::Report, EngineError> Engine::route(std::vector<Point> points,
                                                       std::optional<std::string> start) const
      noexcept {
    return guarded("route", [&] {
      GEOALLOC_ZONE;
      const auto started = Clock::now();
      const auto& rc = config_.routing;
      const auto matrix = distance::compute(points, config_.distance.metric,
                                            config_.distance.config, services_.http);

      routing::RouteOptions options;
      options.closed = rc.closed;
      if (rc.time_limit_ms) options.time_limit = std::chrono::milliseconds(*rc.time_limit_ms);
      if (!start) start = rc.start;
      if (start) options.start = index_of(points, *start);

      auto solver
          = routing::create_solver(rc.backend, config_.distance.config, services_.http);
      const auto route = solver->solve(points, matrix, options);

      io::Report report;
      report.metadata = metadata_for("route", route.backend, config_);
      report.metadata.total_distance = route.total_distance;
      report.metadata.routes.push_back(
          {std::nullopt, route.order.size(), route.total_distance, route.closed, route.backend});
      for (size_t pos = 0; pos < route.order.size(); ++pos) {
        io::OutputRow row;
        row.point = route.order[pos];
        row.route_index = pos;
        report.rows.push_back(std::move(row));
      }
      report.points = std::move(points);
      report.metadata.elapsed_ms = elapsed_ms(started);
      return report;
    });
  }

  std::expected<io::Report, EngineError> Engine::cluster_and_route(
      std::vector<Point> points) const noexcept {
    return guarded("cluster_and_route", [&] {
      GEOALLOC_ZONE;
      const auto started = Clock::now();
      const auto& cc = config_.clustering;
      const auto& rc = config_.routing;
      const auto matrix = distance::compute(points, config_.distance.metric,
                                            config_.distance.config, services_.http);
      auto partitioner
          = clustering::create_partitioner(cc.method, config_.distance.metric, services_.runner);
      const auto result = partitioner->partition(points, matrix, cc.k, cc.seed);
      auto solver
          = routing::create_solver(rc.backend, config_.distance.config, services_.http);
      const std::optional<size_t> start
          = rc.start ? std::optional<size_t>(index_of(points, *rc.start)) : std::nullopt;

      io::Report report;
      report.metadata = metadata_for("cluster_and_route", result.method, config_);
      report.metadata.iterations = result.iterations;
      report.metadata.converged = result.converged;
      report.metadata.seed = cc.seed;
      report.metadata.inertia = result.inertia;
      report.metadata.balance = clustering::summarize(result, matrix);

      double total = 0.0;
      for (const auto& cluster : result.clusters) {
        std::vector<Point> members;
        members.reserve(cluster.members.size());
        for (size_t i : cluster.members) members.push_back(points[i]);

        routing::RouteOptions options;
        options.closed = rc.closed;
        if (rc.time_limit_ms) options.time_limit = std::chrono::milliseconds(*rc.time_limit_ms);
        if (start) {
          const auto it = std::find(cluster.members.begin(), cluster.members.end(), *start);
          if (it != cluster.members.end()) {
            options.start = static_cast<size_t>(it - cluster.members.begin());
          }
        }

        const auto route = solver->solve(members, matrix.subset(cluster.members), options);
        total += route.total_distance;
        report.metadata.routes.push_back(
            {cluster.id, route.order.size(), route.total_distance, route.closed, route.backend});
        for (size_t pos = 0; pos < route.order.size(); ++pos) {
          io::OutputRow row;
          row.point = cluster.members[route.order[pos]];
          row.cluster = cluster.id;
          row.route_index = pos;
          report.rows.push_back(std::move(row));
        }
      }
      report.metadata.total_distance = total;
      report.points = std::move(points);
      report.metadata.elapsed_ms = elapsed_ms(started);
      return report;
    });
  }

  // ===========================================================================
  // Assignment
  // ===========================================================================

  std::expected<io::Report, EngineError> Engine::assign(std::vector<Point> points,
                                                        std::vector<Worker> workers) const
      noexcept {
    return guarded("assign", [&] {
      GEOALLOC_ZONE;
      const auto started = Clock::now();
      const auto cross = distance::compute_cross(points, workers, config_.distance.metric,
                                                 config_.distance.config, services_.http);
      const auto records = std::visit(
          overloaded{[&](assignment::PointOrder) {
                       return assignment::assign(points, workers, cross);
                     },
                     [&](assignment::Ranking) {
                       return assignment::rank_all(points, workers, cross);
                     }},
          config_.assignment.mode);

      io::Report report;
      report.metadata
          = metadata_for("assign", std::string(assignment::mode_name(config_.assignment.mode)),
                         config_);
      report.rows.reserve(records.size());
      for (const auto& a : records) {
        io::OutputRow row;
        row.point = a.point;
        row.worker = workers[a.worker].id;
        row.distance = a.distance;
        row.rank = a.rank;
        report.rows.push_back(std::move(row));
      }
      report.points = std::move(points);
      report.metadata.elapsed_ms = elapsed_ms(started);
      return report;
    });
  }

}  // namespace geoalloc::engine
