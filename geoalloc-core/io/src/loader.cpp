#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/io/loader.hpp>
#include <optional>
#include <sstream>

namespace geoalloc::io {

  namespace {

    std::string_view trim(std::string_view s) {
      const auto begin = s.find_first_not_of(" \t");
      if (begin == std::string_view::npos) return {};
      const auto end = s.find_last_not_of(" \t");
      return s.substr(begin, end - begin + 1);
    }

    // First present spelling. Later spellings stay ordinary attributes.
    template <size_t N>
    size_t find_column(const RecordTable& table, const std::string_view (&names)[N]) {
      for (auto name : names) {
        const size_t idx = table.find(name);
        if (idx < table.columns.size()) return idx;
      }
      throw ValidationError(fmt::format("missing required column '{}'", names[0]),
                            std::string(names[0]));
    }

    bool is_missing(std::string_view text) {
      text = trim(text);
      return text.empty() || text == "nan" || text == "NaN" || text == "NAN" || text == "null";
    }

    double parse_coordinate(std::string_view text, std::string_view column, const std::string& id) {
      text = trim(text);
      double value = 0.0;
      const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
      if (ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(value)) {
        throw ValidationError(fmt::format("non-numeric {} '{}' in row '{}'", column, text, id), id);
      }
      return value;
    }

    // Columns shared by points and workers.
    struct Layout {
      size_t lon;
      size_t lat;
      size_t id;
      std::vector<size_t> attributes;
    };

    Layout layout_of(const RecordTable& table) {
      Layout layout{find_column(table, LONGITUDE_COLUMNS), find_column(table, LATITUDE_COLUMNS),
                    table.find(ID_COLUMN), {}};
      for (size_t c = 0; c < table.columns.size(); ++c) {
        if (c != layout.lon && c != layout.lat && c != layout.id) layout.attributes.push_back(c);
      }
      return layout;
    }

    // Calls emit(row, id, lon, lat) for every row with usable coordinates.
    template <typename Emit>
    void for_each_located_row(const RecordTable& table, const Layout& layout, Emit&& emit) {
      size_t dropped = 0;
      for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        std::string id = layout.id < table.columns.size() ? std::string(trim(row[layout.id]))
                                                          : std::string();
        if (id.empty()) id = std::to_string(r);

        if (is_missing(row[layout.lon]) || is_missing(row[layout.lat])) {
          ++dropped;
          continue;
        }
        const double lon = parse_coordinate(row[layout.lon], "longitude", id);
        const double lat = parse_coordinate(row[layout.lat], "latitude", id);
        if (std::abs(lon) > 180.0 || std::abs(lat) > 90.0) [[unlikely]] {
          throw ValidationError(
              fmt::format("coordinates out of range in row '{}': ({}, {})", id, lon, lat), id);
        }
        emit(row, std::move(id), lon, lat);
      }
      if (dropped > 0) logger()->warn("dropped {} rows with missing coordinates", dropped);
    }

    std::string read_file(const std::filesystem::path& path) {
      std::ifstream file(path, std::ios::binary);
      if (!file.is_open()) {
        throw ValidationError(fmt::format("failed to open input file: {}", path.string()), "input");
      }
      std::stringstream buffer;
      buffer << file.rdbuf();
      return buffer.str();
    }

  }  // namespace

  std::vector<Point> points_from_table(const RecordTable& table) {
    GEOALLOC_ZONE;
    const auto layout = layout_of(table);
    std::vector<Point> points;
    points.reserve(table.rows.size());
    for_each_located_row(table, layout, [&](const auto& row, std::string id, double lon, double lat) {
      Attributes attributes;
      attributes.reserve(layout.attributes.size());
      for (size_t c : layout.attributes) attributes.emplace_back(table.columns[c], row[c]);
      points.push_back({std::move(id), lon, lat, std::move(attributes)});
    });
    logger()->debug("loaded {} points with {} attribute columns", points.size(),
                    layout.attributes.size());
    return points;
  }

  std::vector<Worker> workers_from_table(const RecordTable& table) {
    GEOALLOC_ZONE;
    const size_t cap_col = table.find(CAPACITY_COLUMN);
    const auto layout = layout_of(table);
    std::vector<Worker> workers;
    for_each_located_row(table, layout, [&](const auto& row, std::string id, double lon, double lat) {
      std::optional<int> capacity;
      if (cap_col < table.columns.size() && !trim(row[cap_col]).empty()) {
        const auto text = trim(row[cap_col]);
        int value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || value < 0) {
          throw ValidationError(fmt::format("invalid capacity '{}' for worker '{}'", text, id), id);
        }
        capacity = value;
      }
      workers.push_back({std::move(id), lon, lat, capacity});
    });
    return workers;
  }

  RecordTable read_table(const std::filesystem::path& path) {
    const auto ext = path.extension().string();
    const auto text = read_file(path);
    if (ext == ".json" || ext == ".geojson" || ext == ".JSON") return read_json_records(text);
    std::istringstream in(text);
    return read_csv(in);
  }

  std::vector<Point> load_points(const std::filesystem::path& path) {
    return points_from_table(read_table(path));
  }

  std::vector<Worker> load_workers(const std::filesystem::path& path) {
    return workers_from_table(read_table(path));
  }

}  // namespace geoalloc::io
