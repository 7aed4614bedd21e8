#include <gtest/gtest.h>

#include <filesystem>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/io/loader.hpp>
#include <sstream>

using namespace geoalloc;
using namespace geoalloc::io;

namespace fs = std::filesystem;

class LoaderTest : public ::testing::Test {
protected:
  static fs::path fixture(const std::string& name) {
    return fs::path(__FILE__).parent_path() / "fixtures" / name;
  }

  static RecordTable csv(const std::string& text) {
    std::istringstream in(text);
    return read_csv(in);
  }

  static std::string attr(const Point& p, const std::string& name) {
    for (const auto& [key, value] : p.attributes) {
      if (key == name) return value;
    }
    return "<absent>";
  }
};

// ============================================================================
// SECTION 1: CSV Parsing
// ============================================================================

TEST_F(LoaderTest, SplitsQuotedFields) {
  EXPECT_EQ(split_csv_line(R"(a,"b,c","say ""hi""",)"),
            (std::vector<std::string>{"a", "b,c", "say \"hi\"", ""}));
  EXPECT_THROW((void)split_csv_line(R"(a,"open)"), ValidationError);
}

TEST_F(LoaderTest, EscapeQuotesOnlyWhenNeeded) {
  EXPECT_EQ(escape_csv("plain"), "plain");
  EXPECT_EQ(escape_csv("a,b"), "\"a,b\"");
  EXPECT_EQ(escape_csv("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST_F(LoaderTest, QuotedFieldSpansLineBreaks) {
  const std::string note = "gate code 12\nring twice, \"back door\"";
  const auto table
      = csv("longitude,latitude,note\r\n1,2," + escape_csv(note) + "\r\n3,4,plain\r\n");
  ASSERT_EQ(table.rows.size(), 2u);
  EXPECT_EQ(table.rows[0], (std::vector<std::string>{"1", "2", note}));
  EXPECT_EQ(table.rows[1], (std::vector<std::string>{"3", "4", "plain"}));
  EXPECT_THROW((void)csv("longitude,latitude,note\n1,2,\"never closed\n3,4,x\n"),
               ValidationError);
}

TEST_F(LoaderTest, ShortRowsArePaddedLongRowsRejected) {
  const auto table = csv("longitude,latitude,name\r\n1,2\r\n");
  ASSERT_EQ(table.rows.size(), 1u);
  EXPECT_EQ(table.rows[0], (std::vector<std::string>{"1", "2", ""}));
  EXPECT_THROW((void)csv("longitude,latitude\n1,2,3\n"), ValidationError);
  EXPECT_THROW((void)csv(""), ValidationError);
}

// ============================================================================
// SECTION 2: Points
// ============================================================================

TEST_F(LoaderTest, LoadsCsvWithLegacyColumns) {
  const auto points = load_points(fixture("points.csv"));
  ASSERT_EQ(points.size(), 3u);  // s3 and s4 lack coordinates
  EXPECT_EQ(points[0].id, "s1");
  EXPECT_DOUBLE_EQ(points[0].longitude, 100.5);
  EXPECT_DOUBLE_EQ(points[0].latitude, 13.7);
  EXPECT_EQ(attr(points[0], "name"), "Market, north");
  EXPECT_EQ(attr(points[1], "name"), "Pier \"7\"");
  EXPECT_EQ(points[2].id, "s5");

  // Attributes keep column order and exclude the coordinates and id.
  ASSERT_EQ(points[0].attributes.size(), 2u);
  EXPECT_EQ(points[0].attributes[0].first, "name");
  EXPECT_EQ(points[0].attributes[1].first, "segment");
}

TEST_F(LoaderTest, LoadsJsonRecords) {
  const auto points = load_points(fixture("points.json"));
  ASSERT_EQ(points.size(), 3u);
  EXPECT_EQ(points[1].id, "b");
  EXPECT_DOUBLE_EQ(points[1].longitude, 100.52);
  EXPECT_EQ(attr(points[1], "demand"), "5");
  EXPECT_DOUBLE_EQ(points[2].latitude, 13.73);
  EXPECT_EQ(attr(points[2], "demand"), "");
}

TEST_F(LoaderTest, LoadsGeoJsonPointFeatures) {
  const auto points = load_points(fixture("points.geojson"));
  ASSERT_EQ(points.size(), 2u);
  EXPECT_EQ(points[0].id, "g1");
  EXPECT_EQ(attr(points[0], "kind"), "shop");
  EXPECT_EQ(points[1].id, "g2");
  EXPECT_DOUBLE_EQ(points[1].longitude, 100.6);
}

TEST_F(LoaderTest, RowNumberIsTheDefaultId) {
  const auto points = points_from_table(csv("lon,lat\n1,2\n3,4\n"));
  ASSERT_EQ(points.size(), 2u);
  EXPECT_EQ(points[0].id, "0");
  EXPECT_EQ(points[1].id, "1");
}

TEST_F(LoaderTest, CanonicalColumnWinsOverAlias) {
  const auto points = points_from_table(csv("lon,longitude,latitude\n9,1,2\n"));
  ASSERT_EQ(points.size(), 1u);
  EXPECT_DOUBLE_EQ(points[0].longitude, 1.0);
  EXPECT_EQ(attr(points[0], "lon"), "9");
}

TEST_F(LoaderTest, MissingColumnIsNamed) {
  try {
    (void)points_from_table(csv("id,longitude\na,1\n"));
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e.subject(), "latitude");
  }
}

TEST_F(LoaderTest, NonNumericCoordinateNamesTheRow) {
  try {
    (void)points_from_table(csv("id,longitude,latitude\na,1,2\nb,east,2\n"));
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e.subject(), "b");
  }
}

TEST_F(LoaderTest, OutOfRangeCoordinateIsRejected) {
  EXPECT_THROW((void)points_from_table(csv("id,longitude,latitude\na,181,2\n")), ValidationError);
  EXPECT_THROW((void)points_from_table(csv("id,longitude,latitude\na,1,-91\n")), ValidationError);
}

TEST_F(LoaderTest, MissingFileIsValidationError) {
  EXPECT_THROW((void)load_points(fixture("absent.csv")), ValidationError);
}

TEST_F(LoaderTest, MalformedJsonIsValidationError) {
  EXPECT_THROW((void)read_json_records("{not json"), ValidationError);
  EXPECT_THROW((void)read_json_records(R"({"a": 1})"), ValidationError);
  EXPECT_THROW((void)read_json_records(R"({"type": "FeatureCollection", "features": []})"),
               ValidationError);
}

// ============================================================================
// SECTION 3: Workers
// ============================================================================

TEST_F(LoaderTest, LoadsWorkerCapacities) {
  const auto workers = load_workers(fixture("workers.csv"));
  ASSERT_EQ(workers.size(), 3u);
  EXPECT_EQ(workers[0].capacity, 2);
  EXPECT_FALSE(workers[1].capacity.has_value());
  EXPECT_EQ(workers[2].capacity, 0);
}

TEST_F(LoaderTest, RejectsBadCapacity) {
  EXPECT_THROW((void)workers_from_table(csv("id,lon,lat,capacity\nw,1,2,-3\n")), ValidationError);
  EXPECT_THROW((void)workers_from_table(csv("id,lon,lat,capacity\nw,1,2,lots\n")),
               ValidationError);
}
