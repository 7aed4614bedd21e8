#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/provider.hpp>
#include <geoalloc/distance/table_service.hpp>
#include <nlohmann/json.hpp>
#include <vector>

#include "fake_http_client.hpp"

using namespace geoalloc;
using namespace geoalloc::distance;
using geoalloc::testing::FakeHttpClient;
using json = nlohmann::json;

namespace {

  // Road distance stand-in: 1000 m per degree of longitude, plus 1 m per
  // degree of latitude in the source so the table is directed.
  double fake_road(std::pair<double, double> a, std::pair<double, double> b) {
    if (a == b) return 0.0;
    return std::abs(a.first - b.first) * 1000.0 + a.second;
  }

  HttpResponse osrm_ok(const std::string& url) {
    const auto coords = geoalloc::testing::osrm_coordinates(url);
    const auto src = geoalloc::testing::osrm_indices(url, "sources");
    const auto dst = geoalloc::testing::osrm_indices(url, "destinations");
    json distances = json::array();
    json durations = json::array();
    for (size_t s : src) {
      json row = json::array();
      json drow = json::array();
      for (size_t d : dst) {
        row.push_back(fake_road(coords[s], coords[d]));
        drow.push_back(fake_road(coords[s], coords[d]) / 10.0);
      }
      distances.push_back(row);
      durations.push_back(drow);
    }
    json body = {{"code", "Ok"}, {"distances", distances}, {"durations", durations}};
    return {200, body.dump()};
  }

}  // namespace

class ExternalTableTest : public ::testing::Test {
protected:
  void SetUp() override {
    for (int i = 0; i < 5; ++i) {
      points.push_back({"p" + std::to_string(i), 100.0 + i, 13.0 + 0.1 * i, {}});
    }
    config.max_table_size = 2;
    config.retry = RetryPolicy{3, 0, 2.0, 0};
    config.max_in_flight = 2;
  }

  std::vector<Point> points;
  DistanceConfig config;
};

// =============================================================================
// SECTION 1: OSRM Table
// =============================================================================

TEST_F(ExternalTableTest, ChunkedTableIsAssembled) {
  auto http = std::make_shared<FakeHttpClient>(
      [](const std::string& url, size_t) { return osrm_ok(url); });

  auto m = compute(points, ExternalRouting{}, config, http);

  EXPECT_EQ(http->calls(), 9u);
  EXPECT_FALSE(m.symmetric);
  ASSERT_EQ(m.size(), 5u);
  for (size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(m(i, i), 0.0);
    for (size_t j = 0; j < 5; ++j) {
      if (i == j) continue;
      double expected = std::abs(double(i) - double(j)) * 1000.0 + points[i].latitude;
      EXPECT_NEAR(m(i, j), expected, 1e-3);
    }
  }
  EXPECT_NO_THROW(m.validate());
}

TEST_F(ExternalTableTest, DurationsAreParallelMatrix) {
  config.with_durations = true;
  auto http = std::make_shared<FakeHttpClient>(
      [](const std::string& url, size_t) { return osrm_ok(url); });

  auto m = compute(points, ExternalRouting{}, config, http);
  ASSERT_TRUE(m.durations.has_value());
  EXPECT_NEAR((*m.durations)(0, 1), m(0, 1) / 10.0, 1e-6);
  EXPECT_EQ((*m.durations)(3, 3), 0.0);
  for (const auto& url : http->urls()) {
    EXPECT_NE(url.find("annotations=distance,duration"), std::string::npos);
  }
}

TEST_F(ExternalTableTest, RequestUrlFormat) {
  config.max_table_size = 10;
  config.base_url = "http://osrm.local:5000";
  auto http = std::make_shared<FakeHttpClient>(
      [](const std::string& url, size_t) { return osrm_ok(url); });

  (void)compute(std::span<const Point>(points).first(2), ExternalRouting{}, config, http);
  auto urls = http->urls();
  ASSERT_EQ(urls.size(), 1u);
  EXPECT_EQ(urls[0],
            "http://osrm.local:5000/table/v1/driving/"
            "100.000000,13.000000;101.000000,13.100000;100.000000,13.000000;101.000000,13.100000"
            "?sources=0;1&destinations=2;3&annotations=distance");
}

TEST_F(ExternalTableTest, TransientFailureRetried) {
  config.max_table_size = 10;
  auto http = std::make_shared<FakeHttpClient>([](const std::string& url, size_t call) {
    if (call == 0) return HttpResponse{503, "unavailable"};
    return osrm_ok(url);
  });

  auto m = compute(points, ExternalRouting{}, config, http);
  EXPECT_EQ(http->calls(), 2u);
  EXPECT_EQ(m.size(), 5u);
}

TEST_F(ExternalTableTest, PermanentFailureCancelsOutstandingChunks) {
  config.max_in_flight = 1;
  auto http = std::make_shared<FakeHttpClient>(
      [](const std::string&, size_t) { return HttpResponse{401, "bad credentials"}; });

  try {
    (void)compute(points, ExternalRouting{}, config, http);
    FAIL() << "expected ExternalServiceError";
  } catch (const ExternalServiceError& e) {
    EXPECT_FALSE(e.transient());
    EXPECT_EQ(e.http_status(), 401);
    EXPECT_EQ(e.kind(), ErrorKind::external_service);
  }
  EXPECT_EQ(http->calls(), 1u);
}

TEST_F(ExternalTableTest, UnresolvedCellFailsWholeCall) {
  config.max_table_size = 10;
  auto http = std::make_shared<FakeHttpClient>([](const std::string& url, size_t) {
    auto response = osrm_ok(url);
    auto body = json::parse(response.body);
    body["distances"][1][3] = nullptr;
    response.body = body.dump();
    return response;
  });

  try {
    (void)compute(points, ExternalRouting{}, config, http);
    FAIL() << "expected ExternalServiceError";
  } catch (const ExternalServiceError& e) {
    EXPECT_EQ(e.subject(), "p1");
    EXPECT_NE(std::string(e.what()).find("p3"), std::string::npos);
  }
}

TEST_F(ExternalTableTest, ServiceErrorCodeIsPermanent) {
  auto http = std::make_shared<FakeHttpClient>([](const std::string&, size_t) {
    return HttpResponse{200, R"({"code":"NoSegment","message":"Could not find a matching segment"})"};
  });
  try {
    (void)compute(points, ExternalRouting{}, config, http);
    FAIL() << "expected ExternalServiceError";
  } catch (const ExternalServiceError& e) {
    EXPECT_FALSE(e.transient());
    EXPECT_NE(std::string(e.what()).find("NoSegment"), std::string::npos);
  }
}

TEST_F(ExternalTableTest, MalformedBodyIsPermanent) {
  auto http = std::make_shared<FakeHttpClient>(
      [](const std::string&, size_t) { return HttpResponse{200, "<html>oops</html>"}; });
  EXPECT_THROW((void)compute(points, ExternalRouting{}, config, http), ExternalServiceError);
  EXPECT_EQ(http->calls(), 1u);
}

TEST_F(ExternalTableTest, CrossTableAgainstWorkers) {
  config.max_table_size = 3;
  std::vector<Worker> workers{{"w0", 100.0, 13.0, 1}, {"w1", 104.0, 13.0, 1}};
  auto http = std::make_shared<FakeHttpClient>(
      [](const std::string& url, size_t) { return osrm_ok(url); });

  auto cross = compute_cross(points, workers, ExternalRouting{}, config, http);
  ASSERT_EQ(cross.rows(), 5u);
  ASSERT_EQ(cross.cols(), 2u);
  EXPECT_NEAR(cross(4, 1), 13.4, 1e-6);
  EXPECT_NEAR(cross(1, 0), 1000.0 + 13.1, 1e-6);
}

// =============================================================================
// SECTION 2: Google Distance Matrix
// =============================================================================

class GoogleMatrixTest : public ::testing::Test {
protected:
  static std::string element_body(size_t rows, size_t cols, const char* element_status = "OK") {
    json body = {{"status", "OK"}, {"rows", json::array()}};
    for (size_t i = 0; i < rows; ++i) {
      json elements = json::array();
      for (size_t j = 0; j < cols; ++j) {
        elements.push_back({{"status", element_status},
                            {"distance", {{"value", 100 * (i + 1) + j}}},
                            {"duration", {{"value", 10 * (i + 1) + j}}}});
      }
      body["rows"].push_back({{"elements", elements}});
    }
    return body.dump();
  }
};

TEST_F(GoogleMatrixTest, ParsesElements) {
  DistanceConfig config;
  config.api_key = "k";
  auto service = make_google_matrix_service(config);
  auto block = service->parse_response(element_body(2, 3), 2, 3, true);
  EXPECT_DOUBLE_EQ(block.distances(1, 2), 202.0);
  ASSERT_TRUE(block.durations.has_value());
  EXPECT_DOUBLE_EQ((*block.durations)(0, 1), 11.0);
}

TEST_F(GoogleMatrixTest, NotFoundElementIsUnresolved) {
  DistanceConfig config;
  auto service = make_google_matrix_service(config);
  auto block = service->parse_response(element_body(1, 1, "NOT_FOUND"), 1, 1, false);
  EXPECT_TRUE(std::isnan(block.distances(0, 0)));
}

TEST_F(GoogleMatrixTest, QuotaStatusClassification) {
  DistanceConfig config;
  auto service = make_google_matrix_service(config);
  try {
    (void)service->parse_response(R"({"status":"OVER_QUERY_LIMIT"})", 1, 1, false);
    FAIL();
  } catch (const ExternalServiceError& e) {
    EXPECT_TRUE(e.transient());
  }
  try {
    (void)service->parse_response(R"({"status":"REQUEST_DENIED","error_message":"bad key"})", 1,
                                  1, false);
    FAIL();
  } catch (const ExternalServiceError& e) {
    EXPECT_FALSE(e.transient());
  }
}

TEST_F(GoogleMatrixTest, RequestsRespectElementLimit) {
  std::vector<Point> points;
  for (int i = 0; i < 12; ++i) points.push_back({std::to_string(i), 100.0 + i * 0.01, 13.0, {}});

  DistanceConfig config;
  config.api_key = "secret";
  config.retry = RetryPolicy{1, 0, 2.0, 0};

  auto http = std::make_shared<FakeHttpClient>([](const std::string& url, size_t) {
    auto count = [](const std::string& list) {
      size_t n = 1;
      for (auto p = list.find("%7C"); p != std::string::npos; p = list.find("%7C", p + 1)) ++n;
      return n;
    };
    auto param = [&](const std::string& key) {
      auto b = url.find(key + "=") + key.size() + 1;
      return url.substr(b, url.find('&', b) - b);
    };
    const size_t rows = count(param("origins"));
    const size_t cols = count(param("destinations"));
    EXPECT_LE(rows * cols, 100u);
    EXPECT_NE(url.find("key=secret"), std::string::npos);
    return HttpResponse{200, GoogleMatrixTest::element_body(rows, cols)};
  });

  auto m = compute(points, ExternalMapping{}, config, http);
  EXPECT_EQ(m.size(), 12u);
  EXPECT_EQ(http->calls(), 4u);
  EXPECT_EQ(m(5, 5), 0.0);
}
