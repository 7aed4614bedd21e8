#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/io/records.hpp>
#include <geoalloc/io/writer.hpp>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>

namespace geoalloc::io {

  using json = nlohmann::json;

  namespace {

    // Output column set of a report.
    struct Columns {
      std::vector<std::string> attributes;
      bool cluster = false;
      bool route_index = false;
      bool worker = false;
      bool distance = false;
      bool rank = false;
    };

    Columns columns_of(const Report& report) {
      Columns c;
      for (const auto& p : report.points) {
        for (const auto& [name, _] : p.attributes) {
          if (std::find(c.attributes.begin(), c.attributes.end(), name) == c.attributes.end()) {
            c.attributes.push_back(name);
          }
        }
      }
      for (const auto& row : report.rows) {
        c.cluster |= row.cluster.has_value();
        c.route_index |= row.route_index.has_value();
        c.worker |= row.worker.has_value();
        c.distance |= row.distance.has_value();
        c.rank |= row.rank.has_value();
      }
      return c;
    }

    const std::string* attribute(const Point& p, const std::string& name) {
      for (const auto& [key, value] : p.attributes) {
        if (key == name) return &value;
      }
      return nullptr;
    }

    const Point& point_of(const Report& report, const OutputRow& row) {
      if (row.point >= report.points.size()) [[unlikely]] {
        throw ValidationError(fmt::format("output row refers to point {} of {}", row.point,
                                          report.points.size()));
      }
      return report.points[row.point];
    }

    // =========================================================================
    // JSON
    // =========================================================================

    json metadata_json(const Metadata& m) {
      json j = {{"stage", m.stage},
                {"method", m.method},
                {"metric", m.metric},
                {"elapsed_ms", m.elapsed_ms}};
      if (m.iterations) j["iterations"] = *m.iterations;
      if (m.converged) j["converged"] = *m.converged;
      if (m.seed) j["seed"] = *m.seed;
      if (m.inertia) j["inertia"] = *m.inertia;
      if (m.total_distance) j["total_distance"] = *m.total_distance;
      if (m.balance) {
        json stats = json::array();
        for (const auto& s : m.balance->clusters) {
          stats.push_back({{"cluster", s.cluster_id},
                           {"size", s.size},
                           {"graph_weight", s.graph_weight},
                           {"mst_weight", s.mst_weight}});
        }
        j["cluster_stats"] = std::move(stats);
        j["size_imbalance"] = m.balance->size_imbalance;
        j["size_cv"] = m.balance->size_cv;
        j["mst_imbalance"] = m.balance->mst_imbalance;
      }
      if (!m.routes.empty()) {
        json routes = json::array();
        for (const auto& r : m.routes) {
          json route = {{"size", r.size},
                        {"total_distance", r.total_distance},
                        {"closed", r.closed},
                        {"backend", r.backend}};
          if (r.cluster) route["cluster"] = *r.cluster;
          routes.push_back(std::move(route));
        }
        j["routes"] = std::move(routes);
      }
      return j;
    }

    json record_json(const Report& report, const OutputRow& row) {
      const auto& p = point_of(report, row);
      json j = {{"id", p.id}, {"longitude", p.longitude}, {"latitude", p.latitude}};
      for (const auto& [key, value] : p.attributes) j[key] = value;
      if (row.cluster) j["cluster"] = *row.cluster;
      if (row.route_index) j["route_index"] = *row.route_index;
      if (row.worker) j["worker"] = *row.worker;
      if (row.distance) j["distance"] = *row.distance;
      if (row.rank) j["rank"] = *row.rank;
      return j;
    }

    // =========================================================================
    // MessagePack
    // =========================================================================

    using Packer = msgpack::packer<msgpack::sbuffer>;

    void pack_metadata(Packer& pk, const Metadata& m) {
      uint32_t count = 4;
      if (m.iterations) ++count;
      if (m.converged) ++count;
      if (m.seed) ++count;
      if (m.inertia) ++count;
      if (m.total_distance) ++count;
      if (m.balance) count += 4;
      if (!m.routes.empty()) ++count;

      pk.pack_map(count);
      pk.pack("stage");
      pk.pack(m.stage);
      pk.pack("method");
      pk.pack(m.method);
      pk.pack("metric");
      pk.pack(m.metric);
      pk.pack("elapsed_ms");
      pk.pack(m.elapsed_ms);
      if (m.iterations) {
        pk.pack("iterations");
        pk.pack(*m.iterations);
      }
      if (m.converged) {
        pk.pack("converged");
        pk.pack(*m.converged);
      }
      if (m.seed) {
        pk.pack("seed");
        pk.pack(*m.seed);
      }
      if (m.inertia) {
        pk.pack("inertia");
        pk.pack(*m.inertia);
      }
      if (m.total_distance) {
        pk.pack("total_distance");
        pk.pack(*m.total_distance);
      }
      if (m.balance) {
        pk.pack("cluster_stats");
        pk.pack_array(static_cast<uint32_t>(m.balance->clusters.size()));
        for (const auto& s : m.balance->clusters) {
          pk.pack_map(4);
          pk.pack("cluster");
          pk.pack(s.cluster_id);
          pk.pack("size");
          pk.pack(static_cast<uint64_t>(s.size));
          pk.pack("graph_weight");
          pk.pack(s.graph_weight);
          pk.pack("mst_weight");
          pk.pack(s.mst_weight);
        }
        pk.pack("size_imbalance");
        pk.pack(m.balance->size_imbalance);
        pk.pack("size_cv");
        pk.pack(m.balance->size_cv);
        pk.pack("mst_imbalance");
        pk.pack(m.balance->mst_imbalance);
      }
      if (!m.routes.empty()) {
        pk.pack("routes");
        pk.pack_array(static_cast<uint32_t>(m.routes.size()));
        for (const auto& r : m.routes) {
          pk.pack_map(r.cluster ? 5 : 4);
          if (r.cluster) {
            pk.pack("cluster");
            pk.pack(*r.cluster);
          }
          pk.pack("size");
          pk.pack(static_cast<uint64_t>(r.size));
          pk.pack("total_distance");
          pk.pack(r.total_distance);
          pk.pack("closed");
          pk.pack(r.closed);
          pk.pack("backend");
          pk.pack(r.backend);
        }
      }
    }

    void pack_record(Packer& pk, const Report& report, const OutputRow& row) {
      const auto& p = point_of(report, row);
      uint32_t count = 3 + static_cast<uint32_t>(p.attributes.size());
      for (bool present : {row.cluster.has_value(), row.route_index.has_value(),
                           row.worker.has_value(), row.distance.has_value(), row.rank.has_value()}) {
        if (present) ++count;
      }

      pk.pack_map(count);
      pk.pack("id");
      pk.pack(p.id);
      pk.pack("longitude");
      pk.pack(p.longitude);
      pk.pack("latitude");
      pk.pack(p.latitude);
      for (const auto& [key, value] : p.attributes) {
        pk.pack(key);
        pk.pack(value);
      }
      if (row.cluster) {
        pk.pack("cluster");
        pk.pack(*row.cluster);
      }
      if (row.route_index) {
        pk.pack("route_index");
        pk.pack(static_cast<uint64_t>(*row.route_index));
      }
      if (row.worker) {
        pk.pack("worker");
        pk.pack(*row.worker);
      }
      if (row.distance) {
        pk.pack("distance");
        pk.pack(*row.distance);
      }
      if (row.rank) {
        pk.pack("rank");
        pk.pack(*row.rank);
      }
    }

    void write_text(const std::filesystem::path& path, const std::string& data) {
      std::ofstream file(path, std::ios::binary);
      if (!file.is_open()) {
        throw ValidationError(fmt::format("failed to open output file: {}", path.string()),
                              "output");
      }
      file.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

  }  // namespace

  std::string_view format_name(OutputFormat format) noexcept {
    switch (format) {
      case OutputFormat::csv:
        return "csv";
      case OutputFormat::json:
        return "json";
      case OutputFormat::msgpack:
        return "msgpack";
    }
    return "unknown";
  }

  OutputFormat parse_format(std::string_view name) {
    if (name == "csv") return OutputFormat::csv;
    if (name == "json") return OutputFormat::json;
    if (name == "msgpack") return OutputFormat::msgpack;
    throw ValidationError("unknown output format '" + std::string(name) + "'", "format");
  }

  // ===========================================================================
  // CSV
  // ===========================================================================

  void write_csv(std::ostream& out, const Report& report) {
    GEOALLOC_ZONE;
    const auto cols = columns_of(report);

    out << "id,longitude,latitude";
    for (const auto& name : cols.attributes) out << ',' << escape_csv(name);
    if (cols.cluster) out << ",cluster";
    if (cols.route_index) out << ",route_index";
    if (cols.worker) out << ",worker";
    if (cols.distance) out << ",distance";
    if (cols.rank) out << ",rank";
    out << '\n';

    for (const auto& row : report.rows) {
      const auto& p = point_of(report, row);
      out << escape_csv(p.id) << ',' << fmt::format("{},{}", p.longitude, p.latitude);
      for (const auto& name : cols.attributes) {
        const auto* value = attribute(p, name);
        out << ',' << (value ? escape_csv(*value) : std::string());
      }
      if (cols.cluster) out << ',' << (row.cluster ? std::to_string(*row.cluster) : "");
      if (cols.route_index) {
        out << ',' << (row.route_index ? std::to_string(*row.route_index) : "");
      }
      if (cols.worker) out << ',' << (row.worker ? escape_csv(*row.worker) : "");
      if (cols.distance) out << ',' << (row.distance ? fmt::format("{}", *row.distance) : "");
      if (cols.rank) out << ',' << (row.rank ? std::to_string(*row.rank) : "");
      out << '\n';
    }
  }

  std::string metadata_json_string(const Metadata& metadata, int indent) {
    return metadata_json(metadata).dump(indent);
  }

  std::string to_json_string(const Report& report, int indent) {
    GEOALLOC_ZONE;
    json records = json::array();
    for (const auto& row : report.rows) records.push_back(record_json(report, row));
    json j = {{"metadata", metadata_json(report.metadata)}, {"records", std::move(records)}};
    return j.dump(indent);
  }

  std::string to_msgpack_string(const Report& report) {
    GEOALLOC_ZONE;
    msgpack::sbuffer buffer;
    Packer pk(&buffer);
    pk.pack_map(2);
    pk.pack("metadata");
    pack_metadata(pk, report.metadata);
    pk.pack("records");
    pk.pack_array(static_cast<uint32_t>(report.rows.size()));
    for (const auto& row : report.rows) pack_record(pk, report, row);
    return std::string(buffer.data(), buffer.size());
  }

  void write_report(const std::filesystem::path& path, const Report& report, OutputFormat format) {
    switch (format) {
      case OutputFormat::csv: {
        std::ofstream file(path);
        if (!file.is_open()) {
          throw ValidationError(fmt::format("failed to open output file: {}", path.string()),
                                "output");
        }
        write_csv(file, report);
        auto meta = path;
        meta += ".meta.json";
        write_text(meta, metadata_json_string(report.metadata));
        return;
      }
      case OutputFormat::json:
        write_text(path, to_json_string(report));
        return;
      case OutputFormat::msgpack:
        write_text(path, to_msgpack_string(report));
        return;
    }
  }

}  // namespace geoalloc::io
