#include <fmt/format.h>

#include <cstdlib>
#include <fstream>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/common/overloaded.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/engine/config.hpp>
#include <map>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

namespace geoalloc::engine {

  using json = nlohmann::json;
  using MsgMap = std::map<std::string, msgpack::object>;

  namespace {

    std::string read_file(const std::string& path, std::ios::openmode mode = std::ios::in) {
      std::ifstream file(path, mode);
      if (!file.is_open()) {
        throw ValidationError(fmt::format("failed to open config file: {}", path), "config");
      }
      std::stringstream buffer;
      buffer << file.rdbuf();
      return buffer.str();
    }

    template <typename T> T get_or(const MsgMap& map, const char* key, T fallback) {
      const auto it = map.find(key);
      return it == map.end() ? fallback : it->second.as<T>();
    }

    MsgMap section(const MsgMap& map, const char* key) {
      const auto it = map.find(key);
      return it == map.end() ? MsgMap{} : it->second.as<MsgMap>();
    }

    // =========================================================================
    // Clustering parameters
    // =========================================================================

    void method_to_json(json& j, const clustering::PartitionMethod& method) {
      std::visit(overloaded{[&](const clustering::KMeans& m) {
                              j["max_iter"] = m.max_iter;
                              j["n_init"] = m.n_init;
                            },
                            [&](const clustering::GraphPartition& g) {
                              j["n_closest"] = g.n_closest;
                              j["imbalance"] = g.imbalance;
                              j["balance_edges"] = g.balance_edges;
                              j["executable"] = g.executable;
                              j["preconfiguration"] = g.preconfiguration;
                              j["work_dir"] = g.work_dir;
                            }},
                 method);
    }

    clustering::PartitionMethod method_from_json(const json& j) {
      auto method = clustering::parse_method(j.value("method", "kmeans"));
      std::visit(overloaded{[&](clustering::KMeans& m) {
                              m.max_iter = j.value("max_iter", m.max_iter);
                              m.n_init = j.value("n_init", m.n_init);
                            },
                            [&](clustering::GraphPartition& g) {
                              g.n_closest = j.value("n_closest", g.n_closest);
                              g.imbalance = j.value("imbalance", g.imbalance);
                              g.balance_edges = j.value("balance_edges", g.balance_edges);
                              g.executable = j.value("executable", g.executable);
                              g.preconfiguration = j.value("preconfiguration", g.preconfiguration);
                              g.work_dir = j.value("work_dir", g.work_dir);
                            }},
                 method);
      return method;
    }

    clustering::PartitionMethod method_from_msgpack(const MsgMap& map) {
      auto method = clustering::parse_method(get_or<std::string>(map, "method", "kmeans"));
      std::visit(overloaded{[&](clustering::KMeans& m) {
                              m.max_iter = get_or(map, "max_iter", m.max_iter);
                              m.n_init = get_or(map, "n_init", m.n_init);
                            },
                            [&](clustering::GraphPartition& g) {
                              g.n_closest = get_or(map, "n_closest", g.n_closest);
                              g.imbalance = get_or(map, "imbalance", g.imbalance);
                              g.balance_edges = get_or(map, "balance_edges", g.balance_edges);
                              g.executable = get_or(map, "executable", g.executable);
                              g.preconfiguration
                                  = get_or(map, "preconfiguration", g.preconfiguration);
                              g.work_dir = get_or(map, "work_dir", g.work_dir);
                            }},
                 method);
      return method;
    }

  }  // namespace

  // ===========================================================================
  // JSON
  // ===========================================================================

  EngineConfig EngineConfig::from_json(const std::string& path) {
    GEOALLOC_ZONE;
    return from_json_string(read_file(path));
  }

  EngineConfig EngineConfig::from_json_string(const std::string& json_str) {
    GEOALLOC_ZONE;
    json j = json::parse(json_str, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      throw ValidationError("config is not a JSON object", "config");
    }

    EngineConfig config;
    try {
      const auto dist = j.value("distance", json::object());
      config.distance.metric = distance::parse_metric(dist.value("metric", "great-circle"));
      config.distance.config = dist.get<distance::DistanceConfig>();

      const auto clust = j.value("clustering", json::object());
      config.clustering.method = method_from_json(clust);
      config.clustering.k = clust.value("k", 0);
      config.clustering.seed = clust.value("seed", uint64_t{42});

      const auto rout = j.value("routing", json::object());
      config.routing.backend = routing::parse_backend(rout.value("backend", "mst"));
      config.routing.closed = rout.value("closed", true);
      if (rout.contains("time_limit_ms")) {
        config.routing.time_limit_ms = rout["time_limit_ms"].get<int64_t>();
      }
      if (rout.contains("start")) config.routing.start = rout["start"].get<std::string>();

      const auto assign = j.value("assignment", json::object());
      config.assignment.mode = assignment::parse_mode(assign.value("mode", "point_order"));

      config.log_level = j.value("log_level", "warn");
    } catch (const json::exception& e) {
      throw ValidationError(fmt::format("malformed config: {}", e.what()), "config");
    }
    return config;
  }

  std::string EngineConfig::to_json_string() const {
    json dist = distance.config;
    dist["metric"] = distance::metric_name(distance.metric);

    json clust = {{"method", clustering::method_name(clustering.method)},
                  {"k", clustering.k},
                  {"seed", clustering.seed}};
    method_to_json(clust, clustering.method);

    json rout = {{"backend", routing::backend_name(routing.backend)}, {"closed", routing.closed}};
    if (routing.time_limit_ms) rout["time_limit_ms"] = *routing.time_limit_ms;
    if (routing.start) rout["start"] = *routing.start;

    json j = {{"distance", dist},
              {"clustering", clust},
              {"routing", rout},
              {"assignment", {{"mode", assignment::mode_name(assignment.mode)}}},
              {"log_level", log_level}};
    return j.dump(2);
  }

  // ===========================================================================
  // MessagePack
  // ===========================================================================

  EngineConfig EngineConfig::from_msgpack(const std::string& path) {
    GEOALLOC_ZONE;
    return from_msgpack_string(read_file(path, std::ios::binary));
  }

  EngineConfig EngineConfig::from_msgpack_string(const std::string& data) {
    GEOALLOC_ZONE;
    EngineConfig config;
    try {
      msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
      const auto map = handle.get().as<MsgMap>();

      const auto dist = section(map, "distance");
      config.distance.metric
          = distance::parse_metric(get_or<std::string>(dist, "metric", "great-circle"));
      auto& dc = config.distance.config;
      dc.max_table_size = get_or(dist, "max_table_size", dc.max_table_size);
      dc.max_in_flight = get_or(dist, "max_in_flight", dc.max_in_flight);
      dc.timeout_ms = get_or(dist, "timeout_ms", dc.timeout_ms);
      dc.with_durations = get_or(dist, "with_durations", dc.with_durations);
      dc.base_url = get_or(dist, "base_url", dc.base_url);
      dc.api_key = get_or(dist, "api_key", dc.api_key);
      const auto retry = section(dist, "retry");
      dc.retry.max_attempts = get_or(retry, "max_attempts", dc.retry.max_attempts);
      dc.retry.initial_backoff_ms = get_or(retry, "initial_backoff_ms", dc.retry.initial_backoff_ms);
      dc.retry.multiplier = get_or(retry, "multiplier", dc.retry.multiplier);
      dc.retry.max_backoff_ms = get_or(retry, "max_backoff_ms", dc.retry.max_backoff_ms);

      const auto clust = section(map, "clustering");
      config.clustering.method = method_from_msgpack(clust);
      config.clustering.k = get_or(clust, "k", config.clustering.k);
      config.clustering.seed = get_or(clust, "seed", config.clustering.seed);

      const auto rout = section(map, "routing");
      config.routing.backend = routing::parse_backend(get_or<std::string>(rout, "backend", "mst"));
      config.routing.closed = get_or(rout, "closed", true);
      if (rout.contains("time_limit_ms")) {
        config.routing.time_limit_ms = rout.at("time_limit_ms").as<int64_t>();
      }
      if (rout.contains("start")) config.routing.start = rout.at("start").as<std::string>();

      const auto assign = section(map, "assignment");
      config.assignment.mode
          = assignment::parse_mode(get_or<std::string>(assign, "mode", "point_order"));

      config.log_level = get_or<std::string>(map, "log_level", "warn");
    } catch (const msgpack::type_error& e) {
      throw ValidationError(fmt::format("malformed msgpack config: {}", e.what()), "config");
    } catch (const msgpack::unpack_error& e) {
      throw ValidationError(fmt::format("malformed msgpack config: {}", e.what()), "config");
    }
    return config;
  }

  std::string EngineConfig::to_msgpack_string() const {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    pk.pack_map(5);

    const auto& dc = distance.config;
    pk.pack("distance");
    pk.pack_map(7);
    pk.pack("metric");
    pk.pack(std::string(distance::metric_name(distance.metric)));
    pk.pack("max_table_size");
    pk.pack(dc.max_table_size);
    pk.pack("max_in_flight");
    pk.pack(dc.max_in_flight);
    pk.pack("timeout_ms");
    pk.pack(dc.timeout_ms);
    pk.pack("with_durations");
    pk.pack(dc.with_durations);
    pk.pack("base_url");
    pk.pack(dc.base_url);
    pk.pack("retry");
    pk.pack_map(4);
    pk.pack("max_attempts");
    pk.pack(dc.retry.max_attempts);
    pk.pack("initial_backoff_ms");
    pk.pack(dc.retry.initial_backoff_ms);
    pk.pack("multiplier");
    pk.pack(dc.retry.multiplier);
    pk.pack("max_backoff_ms");
    pk.pack(dc.retry.max_backoff_ms);

    pk.pack("clustering");
    std::visit(overloaded{[&](const clustering::KMeans& m) {
                            pk.pack_map(5);
                            pk.pack("method");
                            pk.pack(std::string("kmeans"));
                            pk.pack("max_iter");
                            pk.pack(m.max_iter);
                            pk.pack("n_init");
                            pk.pack(m.n_init);
                          },
                          [&](const clustering::GraphPartition& g) {
                            pk.pack_map(9);
                            pk.pack("method");
                            pk.pack(std::string("kahip"));
                            pk.pack("n_closest");
                            pk.pack(g.n_closest);
                            pk.pack("imbalance");
                            pk.pack(g.imbalance);
                            pk.pack("balance_edges");
                            pk.pack(g.balance_edges);
                            pk.pack("executable");
                            pk.pack(g.executable);
                            pk.pack("preconfiguration");
                            pk.pack(g.preconfiguration);
                            pk.pack("work_dir");
                            pk.pack(g.work_dir);
                          }},
               clustering.method);
    pk.pack("k");
    pk.pack(clustering.k);
    pk.pack("seed");
    pk.pack(clustering.seed);

    pk.pack("routing");
    pk.pack_map(2 + (routing.time_limit_ms ? 1 : 0) + (routing.start ? 1 : 0));
    pk.pack("backend");
    pk.pack(std::string(routing::backend_name(routing.backend)));
    pk.pack("closed");
    pk.pack(routing.closed);
    if (routing.time_limit_ms) {
      pk.pack("time_limit_ms");
      pk.pack(*routing.time_limit_ms);
    }
    if (routing.start) {
      pk.pack("start");
      pk.pack(*routing.start);
    }

    pk.pack("assignment");
    pk.pack_map(1);
    pk.pack("mode");
    pk.pack(std::string(assignment::mode_name(assignment.mode)));

    pk.pack("log_level");
    pk.pack(log_level);

    return std::string(buffer.data(), buffer.size());
  }

  // ===========================================================================
  // Validation
  // ===========================================================================

  void EngineConfig::resolve_api_key() {
    if (!distance.config.api_key.empty()) return;
    if (const char* key = std::getenv(MAPS_API_KEY_ENV); key != nullptr) {
      distance.config.api_key = key;
    }
  }

  void EngineConfig::validate() const {
    distance.config.validate();
    if (std::holds_alternative<distance::ExternalMapping>(distance.metric)
        && distance.config.api_key.empty()) {
      throw ValidationError(fmt::format("external-mapping metric requires an API key (set {})",
                                        MAPS_API_KEY_ENV),
                            "api_key");
    }
    if (clustering.k < 0) {
      throw ValidationError(fmt::format("k must not be negative, got {}", clustering.k), "k");
    }
    if (routing.time_limit_ms && *routing.time_limit_ms <= 0) {
      throw ValidationError(
          fmt::format("time_limit_ms must be positive, got {}", *routing.time_limit_ms),
          "time_limit_ms");
    }
    if (!is_log_level(log_level)) {
      throw ValidationError(fmt::format("unknown log level '{}'", log_level), "log_level");
    }
  }

}  // namespace geoalloc::engine
