#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <geoalloc/cli/commands.hpp>
#include <string>
#include <vector>

using namespace geoalloc;
using namespace geoalloc::cli;
namespace fs = std::filesystem;

class CliTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path()
           / ("geoalloc_cli_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string write(const std::string& name, const std::string& content) const {
    const auto path = dir_ / name;
    std::ofstream(path) << content;
    return path.string();
  }

  cxxopts::ParseResult parse(std::vector<const char*> args) {
    args.insert(args.begin(), "geoalloc");
    return options_.parse(static_cast<int>(args.size()), args.data());
  }

  static int run(std::vector<const char*> args) {
    args.insert(args.begin(), "geoalloc");
    return run_cli(static_cast<int>(args.size()), args.data());
  }

  fs::path dir_;
  cxxopts::Options options_ = make_options();
};

// ============================================================================
// SECTION 1: Exit Codes
// ============================================================================

TEST_F(CliTest, EveryErrorKindHasItsExitCode) {
  EXPECT_EQ(exit_code(ErrorKind::validation), 2);
  EXPECT_EQ(exit_code(ErrorKind::external_service), 3);
  EXPECT_EQ(exit_code(ErrorKind::solver), 4);
  EXPECT_EQ(exit_code(ErrorKind::capacity_exhausted), 5);
  EXPECT_EQ(exit_code(ErrorKind::internal), 1);
}

TEST_F(CliTest, MalformedOptionValueIsValidationError) {
  EXPECT_EQ(run({"cluster", "-k", "abc"}), 2);
}

TEST_F(CliTest, UnknownCommandIsValidationError) { EXPECT_EQ(run({"scatter"}), 2); }

TEST_F(CliTest, MissingInputFileIsValidationError) {
  const auto out = (dir_ / "out.csv").string();
  EXPECT_EQ(run({"route", "-i", "missing.csv", "-o", out.c_str(), "-d", "planar"}), 2);
}

TEST_F(CliTest, HelpExitsCleanly) { EXPECT_EQ(run({"--help"}), 0); }

TEST_F(CliTest, CapacityExhaustionExitCode) {
  const auto points = write("points.csv", "id,longitude,latitude\np0,1,0\np1,0,1\n");
  const auto workers = write("workers.csv", "id,longitude,latitude,capacity\nw0,0,0,1\n");
  const auto out = (dir_ / "out.json").string();
  EXPECT_EQ(run({"assign", "-i", points.c_str(), "-w", workers.c_str(), "-o", out.c_str(), "-d",
                 "planar", "-f", "json"}),
            5);
}

TEST_F(CliTest, RouteWritesOutput) {
  const auto points = write("points.csv", "id,longitude,latitude\na,0,0\nb,0,1\nc,1,1\nd,1,0\n");
  const auto out = (dir_ / "route.csv").string();
  EXPECT_EQ(run({"route", "-i", points.c_str(), "-o", out.c_str(), "-d", "planar"}), 0);
  EXPECT_TRUE(fs::exists(out));
  EXPECT_TRUE(fs::exists(out + ".meta.json"));
}

// ============================================================================
// SECTION 2: Configuration Precedence
// ============================================================================

TEST_F(CliTest, FlagsOverrideConfigFile) {
  const auto config = write("config.json", R"({
    "distance": {"metric": "planar"},
    "clustering": {"k": 3, "seed": 7},
    "routing": {"backend": "christofides", "closed": true}
  })");
  const auto built = build_config(
      parse({"route", "--config", config.c_str(), "-k", "5", "--backend", "nearest", "--open"}));

  EXPECT_EQ(built.clustering.k, 5);
  EXPECT_TRUE(std::holds_alternative<routing::NearestNeighbor>(built.routing.backend));
  EXPECT_FALSE(built.routing.closed);
  // Untouched keys keep their config values.
  EXPECT_EQ(built.clustering.seed, 7u);
  EXPECT_TRUE(std::holds_alternative<distance::Planar>(built.distance.metric));
}

TEST_F(CliTest, ConfigValuesSurviveWithoutFlags) {
  const auto config = write("config.json", R"({"clustering": {"k": 4}, "log_level": "error"})");
  const auto built = build_config(parse({"cluster", "--config", config.c_str()}));
  EXPECT_EQ(built.clustering.k, 4);
  EXPECT_EQ(built.log_level, "error");
  EXPECT_TRUE(built.routing.closed);
}

TEST_F(CliTest, TimeLimitFlagIsSeconds) {
  const auto built = build_config(parse({"route", "--time-limit", "1.5"}));
  ASSERT_TRUE(built.routing.time_limit_ms.has_value());
  EXPECT_EQ(*built.routing.time_limit_ms, 1500);
}
