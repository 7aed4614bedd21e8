#include <gtest/gtest.h>

#include <algorithm>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/provider.hpp>
#include <geoalloc/routing/tour.hpp>
#include <random>
#include <vector>

using namespace geoalloc;
using namespace geoalloc::routing;
using geoalloc::distance::DistanceMatrix;

namespace {

  DistanceMatrix line(const std::vector<double>& xs) {
    std::vector<Point> points;
    for (size_t i = 0; i < xs.size(); ++i) points.push_back({std::to_string(i), xs[i], 0.0, {}});
    return distance::compute(points, distance::Planar{});
  }

  double matching_weight(const DistanceMatrix& m, const std::vector<Edge>& edges) {
    double w = 0.0;
    for (const auto& [a, b] : edges) w += m(a, b);
    return w;
  }

}  // namespace

TEST(TourTest, DoubledWalkVisitsChildrenInOrder) {
  // Star rooted at 0 with a grandchild under 2.
  const auto matrix = line({0.0, 1.0, -1.0, -2.0});
  const auto tree = distance::minimum_spanning_tree(matrix, 0);
  EXPECT_EQ(doubled_tree_walk(tree), (std::vector<size_t>{0, 1, 0, 2, 3, 2, 0}));
  EXPECT_EQ(shortcut(doubled_tree_walk(tree), 4), (std::vector<size_t>{0, 1, 2, 3}));
}

TEST(TourTest, OddDegreeVerticesOfPath) {
  const auto matrix = line({0.0, 1.0, 2.0, 3.0});
  const auto tree = distance::minimum_spanning_tree(matrix, 0);
  EXPECT_EQ(odd_degree_vertices(tree), (std::vector<size_t>{0, 3}));
}

TEST(TourTest, EulerianCircuitOfTriangle) {
  const std::vector<Edge> edges{{0, 1}, {1, 2}, {2, 0}};
  EXPECT_EQ(eulerian_circuit(3, edges, 0), (std::vector<size_t>{0, 1, 2, 0}));
  EXPECT_EQ(eulerian_circuit(3, edges, 2), (std::vector<size_t>{2, 0, 1, 2}));
}

TEST(TourTest, EulerianCircuitUsesEveryEdge) {
  // Two triangles sharing vertex 0; vertex 0 has degree 4.
  const std::vector<Edge> edges{{0, 1}, {1, 2}, {2, 0}, {0, 3}, {3, 4}, {4, 0}};
  const auto circuit = eulerian_circuit(5, edges, 0);
  ASSERT_EQ(circuit.size(), edges.size() + 1);
  EXPECT_EQ(circuit.front(), 0u);
  EXPECT_EQ(circuit.back(), 0u);
}

TEST(TourTest, DisconnectedMultigraphFails) {
  const std::vector<Edge> edges{{0, 1}, {0, 1}, {2, 3}, {2, 3}};
  EXPECT_THROW((void)eulerian_circuit(4, edges, 0), SolverError);
}

TEST(TourTest, ExactMatchingPairsNeighbours) {
  const auto matrix = line({0.0, 1.0, 10.0, 11.0});
  const auto matching = min_weight_matching(matrix, {0, 1, 2, 3});
  ASSERT_EQ(matching.size(), 2u);
  EXPECT_DOUBLE_EQ(matching_weight(matrix, matching), 2.0);
}

TEST(TourTest, ExactMatchingNeverWorseThanGreedy) {
  std::mt19937 gen(42);
  std::uniform_real_distribution<double> coord(0.0, 50.0);
  for (int trial = 0; trial < 10; ++trial) {
    std::vector<Point> points;
    for (size_t i = 0; i < 12; ++i) points.push_back({std::to_string(i), coord(gen), coord(gen), {}});
    const auto matrix = distance::compute(points, distance::Planar{});
    std::vector<size_t> vertices(12);
    for (size_t i = 0; i < vertices.size(); ++i) vertices[i] = i;

    const auto exact = min_weight_matching(matrix, vertices);
    const auto greedy = greedy_matching(matrix, vertices);
    ASSERT_EQ(exact.size(), 6u);
    ASSERT_EQ(greedy.size(), 6u);
    EXPECT_LE(matching_weight(matrix, exact), matching_weight(matrix, greedy) + 1e-9);

    std::vector<bool> covered(12, false);
    for (const auto& [a, b] : exact) {
      EXPECT_FALSE(covered[a]);
      EXPECT_FALSE(covered[b]);
      covered[a] = covered[b] = true;
    }
  }
}

TEST(TourTest, MatchingRejectsOddVertexCount) {
  const auto matrix = line({0.0, 1.0, 2.0});
  EXPECT_THROW((void)min_weight_matching(matrix, {0, 1, 2}), SolverError);
}
