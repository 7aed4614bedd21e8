#include <fmt/format.h>

#include <cmath>
#include <geoalloc/cli/commands.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/io/loader.hpp>
#include <geoalloc/io/writer.hpp>
#include <iostream>
#include <string>

namespace geoalloc::cli {

  namespace {

    int fail(const engine::EngineError& error) {
      std::cerr << fmt::format("error [{}]: {}\n", to_string(error.kind), error.message);
      if (!error.subject.empty()) std::cerr << fmt::format("  offending input: {}\n", error.subject);
      return exit_code(error.kind);
    }

    int run(const cxxopts::ParseResult& result) {
      const auto command = result["command"].as<std::string>();
      if (command != "cluster" && command != "route" && command != "assign") {
        throw ValidationError(fmt::format("unknown command '{}'", command), "command");
      }
      if (!result.count("input")) throw ValidationError("missing --input", "input");
      if (!result.count("output")) throw ValidationError("missing --output", "output");
      if (command == "assign" && !result.count("workers")) {
        throw ValidationError("assign needs --workers", "workers");
      }

      const auto format = io::parse_format(result["format"].as<std::string>());
      auto engine = engine::Engine::create(build_config(result));
      if (!engine) return fail(engine.error());

      auto points = io::load_points(result["input"].as<std::string>());
      std::expected<io::Report, engine::EngineError> report;
      if (command == "cluster") {
        report = engine->cluster(std::move(points));
      } else if (command == "route") {
        // With k set, every cluster gets its own route.
        report = engine->config().clustering.k > 0 ? engine->cluster_and_route(std::move(points))
                                                   : engine->route(std::move(points));
      } else {
        report = engine->assign(std::move(points),
                                io::load_workers(result["workers"].as<std::string>()));
      }
      if (!report) return fail(report.error());

      io::write_report(result["output"].as<std::string>(), *report, format);
      logger()->info("{} finished in {:.1f} ms, wrote {} rows", command,
                     report->metadata.elapsed_ms, report->rows.size());
      return EXIT_OK;
    }

  }  // namespace

  int exit_code(ErrorKind kind) noexcept {
    switch (kind) {
      case ErrorKind::validation:
        return 2;
      case ErrorKind::external_service:
        return 3;
      case ErrorKind::solver:
        return 4;
      case ErrorKind::capacity_exhausted:
        return 5;
      case ErrorKind::internal:
        return EXIT_OTHER;
    }
    return EXIT_OTHER;
  }

  cxxopts::Options make_options() {
    cxxopts::Options options("geoalloc", "Geographic clustering, routing and assignment");
    options.add_options()
        ("command", "cluster, route or assign", cxxopts::value<std::string>())
        ("i,input", "input points (csv, json, geojson)", cxxopts::value<std::string>())
        ("w,workers", "worker locations for assign", cxxopts::value<std::string>())
        ("o,output", "output path", cxxopts::value<std::string>())
        ("f,format", "output format: csv, json, msgpack",
         cxxopts::value<std::string>()->default_value("csv"))
        ("d,distance", "planar, great-circle, external-routing, external-mapping",
         cxxopts::value<std::string>())
        ("k", "number of clusters", cxxopts::value<int>())
        ("method", "kmeans or kahip", cxxopts::value<std::string>())
        ("backend", "mst, christofides, nearest, ortools, trip", cxxopts::value<std::string>())
        ("mode", "point_order or ranking", cxxopts::value<std::string>())
        ("seed", "random seed", cxxopts::value<uint64_t>())
        ("start", "id of the first point of each route", cxxopts::value<std::string>())
        ("open", "end the route at its last point instead of returning to the start",
         cxxopts::value<bool>()->default_value("false"))
        ("time-limit", "solver time limit in seconds", cxxopts::value<double>())
        ("config", "engine config (json or msgpack)", cxxopts::value<std::string>())
        ("api-key", "maps service API key", cxxopts::value<std::string>())
        ("log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>())
        ("h,help", "print usage");
    options.parse_positional({"command"});
    options.positional_help("<cluster|route|assign>");
    return options;
  }

  engine::EngineConfig build_config(const cxxopts::ParseResult& result) {
    engine::EngineConfig config;
    if (result.count("config")) {
      const auto path = result["config"].as<std::string>();
      config = path.ends_with(".msgpack") ? engine::EngineConfig::from_msgpack(path)
                                          : engine::EngineConfig::from_json(path);
    }
    if (result.count("distance")) {
      config.distance.metric = distance::parse_metric(result["distance"].as<std::string>());
    }
    if (result.count("api-key")) config.distance.config.api_key = result["api-key"].as<std::string>();
    if (result.count("k")) config.clustering.k = result["k"].as<int>();
    if (result.count("method")) {
      config.clustering.method = clustering::parse_method(result["method"].as<std::string>());
    }
    if (result.count("seed")) config.clustering.seed = result["seed"].as<uint64_t>();
    if (result.count("backend")) {
      config.routing.backend = routing::parse_backend(result["backend"].as<std::string>());
    }
    if (result.count("start")) config.routing.start = result["start"].as<std::string>();
    if (result["open"].as<bool>()) config.routing.closed = false;
    if (result.count("time-limit")) {
      config.routing.time_limit_ms
          = static_cast<int64_t>(std::llround(result["time-limit"].as<double>() * 1000.0));
    }
    if (result.count("mode")) {
      config.assignment.mode = assignment::parse_mode(result["mode"].as<std::string>());
    }
    if (result.count("log-level")) config.log_level = result["log-level"].as<std::string>();
    return config;
  }

  int run_cli(int argc, const char* const* argv) {
    auto options = make_options();
    try {
      auto result = options.parse(argc, argv);
      if (result.count("help") || !result.count("command")) {
        std::cout << options.help() << "\n";
        return result.count("help") ? EXIT_OK : exit_code(ErrorKind::validation);
      }
      return run(result);
    } catch (const Error& e) {
      return fail({e.kind(), e.what(), e.subject()});
    } catch (const cxxopts::exceptions::exception& e) {
      std::cerr << "error: " << e.what() << "\n" << options.help() << "\n";
      return exit_code(ErrorKind::validation);
    } catch (const std::exception& e) {
      std::cerr << "error: " << e.what() << "\n";
      return EXIT_OTHER;
    }
  }

}  // namespace geoalloc::cli
