#pragma once
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace geoalloc::io {

  // Untyped input table. Every row has one cell per column.
  struct RecordTable {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    // Index of `name`, or columns.size() when absent.
    [[nodiscard]] size_t find(std::string_view name) const noexcept;
  };

  // One CSV line: ',' delimited, '"' quoted, "" as an escaped quote.
  [[nodiscard]] std::vector<std::string> split_csv_line(std::string_view line);

  // Quotes the field when it holds a delimiter, quote or line break.
  [[nodiscard]] std::string escape_csv(std::string_view field);

  // Header line then records. Short rows are padded, long rows rejected.
  [[nodiscard]] RecordTable read_csv(std::istream& in);

  // A JSON array of flat objects, or a GeoJSON FeatureCollection whose Point
  // features become rows (longitude, latitude, then the properties).
  [[nodiscard]] RecordTable read_json_records(const std::string& text);

}  // namespace geoalloc::io
