#pragma once
#include <filesystem>
#include <geoalloc/common/types.hpp>
#include <geoalloc/io/records.hpp>
#include <string_view>
#include <vector>

namespace geoalloc::io {

  // Accepted spellings, in lookup order, for the coordinate columns.
  inline constexpr std::string_view LONGITUDE_COLUMNS[]
      = {"longitude", "start_long", "long", "lng", "lon"};
  inline constexpr std::string_view LATITUDE_COLUMNS[] = {"latitude", "start_lat", "lat"};

  // Columns with a fixed meaning. Everything else is an attribute.
  inline constexpr std::string_view ID_COLUMN = "id";
  inline constexpr std::string_view CAPACITY_COLUMN = "capacity";

  // Rows with empty or NaN coordinates are dropped with a warning. Missing
  // coordinate columns, non-numeric or out-of-range values throw ValidationError.
  [[nodiscard]] std::vector<Point> points_from_table(const RecordTable& table);
  [[nodiscard]] std::vector<Worker> workers_from_table(const RecordTable& table);

  // .json and .geojson are parsed as JSON, anything else as CSV.
  [[nodiscard]] RecordTable read_table(const std::filesystem::path& path);

  [[nodiscard]] std::vector<Point> load_points(const std::filesystem::path& path);
  [[nodiscard]] std::vector<Worker> load_workers(const std::filesystem::path& path);

}  // namespace geoalloc::io
