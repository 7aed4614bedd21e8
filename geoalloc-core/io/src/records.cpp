#include <fmt/format.h>

#include <algorithm>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/io/records.hpp>
#include <nlohmann/json.hpp>

namespace geoalloc::io {

  using json = nlohmann::json;

  namespace {

    void strip_cr(std::string& line) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
    }

    // Reads one CSV record. A quoted field may span line breaks, so physical
    // lines are joined while an odd number of quotes has been seen.
    bool read_record(std::istream& in, std::string& record, size_t& line_no) {
      if (!std::getline(in, record)) return false;
      ++line_no;
      strip_cr(record);
      auto quotes = std::count(record.begin(), record.end(), '"');
      std::string next;
      while (quotes % 2 != 0 && std::getline(in, next)) {
        ++line_no;
        strip_cr(next);
        record += '\n';
        record += next;
        quotes += std::count(next.begin(), next.end(), '"');
      }
      return true;
    }

    std::string cell_text(const json& value) {
      if (value.is_null()) return {};
      if (value.is_string()) return value.get<std::string>();
      return value.dump();
    }

    size_t column_index(RecordTable& table, const std::string& name) {
      const size_t idx = table.find(name);
      if (idx < table.columns.size()) return idx;
      table.columns.push_back(name);
      for (auto& row : table.rows) row.emplace_back();
      return table.columns.size() - 1;
    }

    void add_row(RecordTable& table, const std::vector<std::pair<std::string, std::string>>& cells) {
      std::vector<size_t> idx;
      idx.reserve(cells.size());
      for (const auto& [name, _] : cells) idx.push_back(column_index(table, name));
      auto& row = table.rows.emplace_back(table.columns.size());
      for (size_t k = 0; k < cells.size(); ++k) row[idx[k]] = cells[k].second;
    }

    RecordTable read_feature_collection(const json& root) {
      RecordTable table;
      const auto& features = root.at("features");
      if (!features.is_array()) throw ValidationError("GeoJSON 'features' is not an array");

      size_t skipped = 0;
      for (const auto& feature : features) {
        if (!feature.is_object() || !feature.contains("geometry")
            || !feature["geometry"].is_object()) {
          ++skipped;
          continue;
        }
        const auto& geometry = feature["geometry"];
        const auto coords = geometry.value("coordinates", json::array());
        if (geometry.value("type", "") != "Point" || !coords.is_array() || coords.size() < 2) {
          ++skipped;
          continue;
        }
        std::vector<std::pair<std::string, std::string>> cells{
            {"longitude", cell_text(coords[0])}, {"latitude", cell_text(coords[1])}};
        if (feature.contains("id")) cells.emplace_back("id", cell_text(feature["id"]));
        if (feature.contains("properties") && feature["properties"].is_object()) {
          for (const auto& [key, value] : feature["properties"].items()) {
            cells.emplace_back(key, cell_text(value));
          }
        }
        add_row(table, cells);
      }
      if (skipped > 0) logger()->warn("skipped {} GeoJSON features without Point geometry", skipped);
      if (table.rows.empty()) throw ValidationError("no Point features found in GeoJSON");
      return table;
    }

  }  // namespace

  size_t RecordTable::find(std::string_view name) const noexcept {
    return static_cast<size_t>(std::find(columns.begin(), columns.end(), name) - columns.begin());
  }

  std::vector<std::string> split_csv_line(std::string_view line) {
    std::vector<std::string> fields(1);
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
      const char c = line[i];
      if (quoted) {
        if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
          fields.back() += '"';
          ++i;
        } else if (c == '"') {
          quoted = false;
        } else {
          fields.back() += c;
        }
      } else if (c == '"') {
        quoted = true;
      } else if (c == ',') {
        fields.emplace_back();
      } else {
        fields.back() += c;
      }
    }
    if (quoted) throw ValidationError("unterminated quoted field in CSV line");
    return fields;
  }

  std::string escape_csv(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) return std::string(field);
    std::string out = "\"";
    for (char c : field) {
      if (c == '"') out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

  RecordTable read_csv(std::istream& in) {
    RecordTable table;
    std::string line;
    size_t line_no = 0;
    if (!read_record(in, line, line_no)) throw ValidationError("CSV input is empty");
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
    table.columns = split_csv_line(line);

    while (read_record(in, line, line_no)) {
      if (line.empty()) continue;
      auto fields = split_csv_line(line);
      if (fields.size() > table.columns.size()) {
        throw ValidationError(fmt::format("CSV line {} has {} fields, header has {}", line_no,
                                          fields.size(), table.columns.size()));
      }
      fields.resize(table.columns.size());
      table.rows.push_back(std::move(fields));
    }
    return table;
  }

  RecordTable read_json_records(const std::string& text) {
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) throw ValidationError("input is not valid JSON");
    if (root.is_object() && root.contains("features")) return read_feature_collection(root);
    if (!root.is_array()) {
      throw ValidationError("JSON input must be an array of records or a FeatureCollection");
    }

    RecordTable table;
    for (size_t i = 0; i < root.size(); ++i) {
      const auto& record = root[i];
      if (!record.is_object()) {
        throw ValidationError(fmt::format("JSON record {} is not an object", i), std::to_string(i));
      }
      std::vector<std::pair<std::string, std::string>> cells;
      for (const auto& [key, value] : record.items()) cells.emplace_back(key, cell_text(value));
      add_row(table, cells);
    }
    return table;
  }

}  // namespace geoalloc::io
