#pragma once
#include <filesystem>
#include <geoalloc/io/report.hpp>
#include <ostream>
#include <string>
#include <string_view>

namespace geoalloc::io {

  enum class OutputFormat { csv, json, msgpack };

  [[nodiscard]] std::string_view format_name(OutputFormat format) noexcept;
  // csv, json, msgpack. Throws ValidationError otherwise.
  [[nodiscard]] OutputFormat parse_format(std::string_view name);

  // Records only: id, longitude, latitude, attribute columns, then the stage
  // columns present in at least one row.
  void write_csv(std::ostream& out, const Report& report);

  // {"metadata": {...}, "records": [...]}
  [[nodiscard]] std::string to_json_string(const Report& report, int indent = 2);
  [[nodiscard]] std::string metadata_json_string(const Metadata& metadata, int indent = 2);

  // Same layout as the JSON document.
  [[nodiscard]] std::string to_msgpack_string(const Report& report);

  // CSV output also writes the metadata block next to it as "<path>.meta.json".
  void write_report(const std::filesystem::path& path, const Report& report, OutputFormat format);

}  // namespace geoalloc::io
