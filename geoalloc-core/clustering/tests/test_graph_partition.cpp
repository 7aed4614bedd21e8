#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <geoalloc/clustering/graph_partition.hpp>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/provider.hpp>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace geoalloc;
using namespace geoalloc::clustering;
namespace fs = std::filesystem;

namespace {

  std::string flag_value(const std::vector<std::string>& argv, const std::string& flag) {
    for (const auto& a : argv) {
      if (a.rfind(flag + "=", 0) == 0) return a.substr(flag.size() + 1);
    }
    return {};
  }

  // Stands in for kaffpa: checks the graph header and writes contiguous blocks.
  class FakeKaffpa : public ProcessRunner {
  public:
    int exit_status = 0;
    bool write_output = true;
    std::vector<std::vector<std::string>> calls;
    std::string graph_header;

    [[nodiscard]] int run(const std::vector<std::string>& argv) override {
      calls.push_back(argv);
      std::ifstream graph(argv.at(1));
      std::getline(graph, graph_header);
      std::istringstream header(graph_header);
      size_t n = 0;
      header >> n;

      const int k = std::stoi(flag_value(argv, "--k"));
      if (write_output) {
        std::ofstream out(flag_value(argv, "--output_filename"));
        for (size_t i = 0; i < n; ++i) out << (i * k / n) << '\n';
      }
      return exit_status;
    }
  };

  std::vector<Point> line_points(size_t n) {
    std::vector<Point> points;
    for (size_t i = 0; i < n; ++i) points.push_back({"p" + std::to_string(i), double(i), 0.0, {}});
    return points;
  }

}  // namespace

// =============================================================================
// SECTION 1: Proximity Graph
// =============================================================================

TEST(ProximityGraphTest, LineGraphMetisText) {
  auto points = line_points(3);
  auto matrix = distance::compute(points, distance::Planar{});
  auto graph = build_proximity_graph(matrix, 1);

  EXPECT_EQ(graph.n_vertices(), 3u);
  EXPECT_EQ(graph.n_edges(), 2u);

  std::ostringstream out;
  write_metis(out, graph);
  EXPECT_EQ(out.str(), "3 2 1\n2 1000000\n1 1000000 3 1000000\n2 1000000\n");
}

TEST(ProximityGraphTest, SymmetricWithBoundedWeights) {
  std::mt19937 gen(42);
  std::uniform_real_distribution<double> coord(0.0, 1.0);
  std::vector<Point> points;
  for (int i = 0; i < 80; ++i) points.push_back({std::to_string(i), coord(gen), coord(gen), {}});
  auto matrix = distance::compute(points, distance::Planar{});

  const int n_closest = 5;
  auto graph = build_proximity_graph(matrix, n_closest);
  ASSERT_EQ(graph.n_vertices(), 80u);

  int64_t max_weight = 0;
  for (size_t v = 0; v < 80; ++v) {
    EXPECT_GE(graph.xadj[v + 1] - graph.xadj[v], n_closest);
    for (auto e = graph.xadj[v]; e < graph.xadj[v + 1]; ++e) {
      const auto u = static_cast<size_t>(graph.adjncy[e]);
      EXPECT_NE(u, v);
      EXPECT_GE(graph.adjcwgt[e], 1);
      EXPECT_LE(graph.adjcwgt[e], 1000000);
      max_weight = std::max(max_weight, graph.adjcwgt[e]);

      bool back = false;
      for (auto f = graph.xadj[u]; f < graph.xadj[u + 1]; ++f) {
        if (static_cast<size_t>(graph.adjncy[f]) == v) {
          back = true;
          EXPECT_EQ(graph.adjcwgt[f], graph.adjcwgt[e]);
        }
      }
      EXPECT_TRUE(back) << v << " -> " << u;
    }
  }
  EXPECT_EQ(max_weight, 1000000);
}

TEST(ProximityGraphTest, NClosestClampedToPointCount) {
  auto matrix = distance::compute(line_points(4), distance::Planar{});
  auto graph = build_proximity_graph(matrix, 50);
  EXPECT_EQ(graph.n_edges(), 6u);
  EXPECT_THROW((void)build_proximity_graph(matrix, 0), ValidationError);
}

// =============================================================================
// SECTION 2: Partition Files
// =============================================================================

TEST(PartitionFileTest, ReadsBlocks) {
  std::istringstream in("0\n1\n1\n0\n");
  EXPECT_EQ(read_partition(in, 4, 2), (std::vector<int>{0, 1, 1, 0}));
}

TEST(PartitionFileTest, ShortFileIsPartitionError) {
  std::istringstream in("0\n1\n");
  EXPECT_THROW((void)read_partition(in, 4, 2), PartitionError);
}

TEST(PartitionFileTest, OutOfRangeBlockIsPartitionError) {
  std::istringstream in("0\n3\n");
  try {
    (void)read_partition(in, 2, 2);
    FAIL();
  } catch (const PartitionError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::solver);
    EXPECT_EQ(e.stage(), "partition");
    EXPECT_EQ(e.input_size(), 2u);
  }
}

// =============================================================================
// SECTION 3: Delegated Partitioning
// =============================================================================

class GraphPartitionerTest : public ::testing::Test {
protected:
  void SetUp() override {
    points = line_points(12);
    matrix = distance::compute(points, distance::Planar{});
    params.work_dir = fs::temp_directory_path().string();
  }

  std::vector<Point> points;
  distance::DistanceMatrix matrix;
  GraphPartition params;
  std::shared_ptr<FakeKaffpa> runner = std::make_shared<FakeKaffpa>();
};

TEST_F(GraphPartitionerTest, DelegatesAndReadsLabels) {
  auto partitioner = create_partitioner(params, distance::Planar{}, runner);
  auto result = partitioner->partition(points, matrix, 3, 77);

  ASSERT_EQ(runner->calls.size(), 1u);
  EXPECT_EQ(runner->graph_header.substr(0, 3), "12 ");
  EXPECT_EQ(result.method, "kahip");
  EXPECT_EQ(result.labels, (std::vector<int>{0, 0, 0, 0, 1, 1, 1, 1, 2, 2, 2, 2}));
  ASSERT_EQ(result.clusters.size(), 3u);
  EXPECT_EQ(result.clusters[1].members, (std::vector<size_t>{4, 5, 6, 7}));
  ASSERT_TRUE(result.clusters[2].centroid.has_value());
  EXPECT_DOUBLE_EQ(result.clusters[2].centroid->longitude, 9.5);
  EXPECT_FALSE(result.inertia.has_value());
}

TEST_F(GraphPartitionerTest, CommandLine) {
  params.balance_edges = true;
  GraphPartitioner partitioner(params, runner);
  auto argv = partitioner.command("/tmp/g.metis", "/tmp/out.txt", 4, 1234);

  const std::vector<std::string> expected{"kaffpa",
                                          "/tmp/g.metis",
                                          "--k=4",
                                          "--seed=1234",
                                          "--imbalance=3",
                                          "--preconfiguration=strong",
                                          "--output_filename=/tmp/out.txt",
                                          "--balance_edges"};
  EXPECT_EQ(argv, expected);
}

TEST_F(GraphPartitionerTest, ScratchFilesRemoved) {
  params.work_dir = (fs::temp_directory_path() / "geoalloc-test-scratch").string();
  fs::create_directories(params.work_dir);
  auto partitioner = create_partitioner(params, distance::Planar{}, runner);
  (void)partitioner->partition(points, matrix, 2, 1);
  EXPECT_TRUE(fs::is_empty(params.work_dir));
  fs::remove_all(params.work_dir);
}

TEST_F(GraphPartitionerTest, UnusableWorkDirIsPartitionError) {
  const auto blocker = fs::temp_directory_path() / "geoalloc-test-not-a-dir";
  std::ofstream(blocker) << "file";
  params.work_dir = (blocker / "scratch").string();

  try {
    (void)create_partitioner(params, distance::Planar{}, runner)->partition(points, matrix, 3, 0);
    FAIL() << "expected PartitionError";
  } catch (const PartitionError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::solver);
    EXPECT_NE(std::string(e.what()).find("scratch directory"), std::string::npos);
  }
  EXPECT_TRUE(runner->calls.empty());
  fs::remove(blocker);
}

TEST_F(GraphPartitionerTest, SingleClusterSkipsExternalCall) {
  auto result = create_partitioner(params, distance::Planar{}, runner)
                    ->partition(points, matrix, 1, 0);
  EXPECT_TRUE(runner->calls.empty());
  EXPECT_EQ(result.clusters[0].members.size(), 12u);
}

TEST_F(GraphPartitionerTest, NonZeroExitIsPartitionError) {
  runner->exit_status = 2;
  EXPECT_THROW((void)create_partitioner(params, distance::Planar{}, runner)
                   ->partition(points, matrix, 3, 0),
               PartitionError);
}

TEST_F(GraphPartitionerTest, MissingOutputIsPartitionError) {
  runner->write_output = false;
  EXPECT_THROW((void)create_partitioner(params, distance::Planar{}, runner)
                   ->partition(points, matrix, 3, 0),
               PartitionError);
}

TEST_F(GraphPartitionerTest, MissingExecutableIsPartitionError) {
  params.executable = "geoalloc-no-such-partitioner";
  auto partitioner = create_partitioner(params, distance::Planar{});
  try {
    (void)partitioner->partition(points, matrix, 3, 0);
    FAIL() << "expected PartitionError";
  } catch (const PartitionError& e) {
    EXPECT_NE(std::string(e.what()).find("127"), std::string::npos);
  }
}

TEST_F(GraphPartitionerTest, InvalidKBeforeAnyCall) {
  EXPECT_THROW((void)create_partitioner(params, distance::Planar{}, runner)
                   ->partition(points, matrix, 13, 0),
               ValidationError);
  EXPECT_TRUE(runner->calls.empty());
}

TEST_F(GraphPartitionerTest, SubprocessRunnerExitStatus) {
  SubprocessRunner shell;
  EXPECT_EQ(shell.run({"sh", "-c", "exit 0"}), 0);
  EXPECT_EQ(shell.run({"sh", "-c", "exit 5"}), 5);
  EXPECT_THROW((void)shell.run({}), std::invalid_argument);
}
