#pragma once
#include <cstddef>
#include <geoalloc/distance/distance_matrix.hpp>
#include <geoalloc/distance/spanning_tree.hpp>
#include <utility>
#include <vector>

namespace geoalloc::routing {

  using Edge = std::pair<size_t, size_t>;

  // Closed walk over the doubled tree: every tree edge traversed down and back
  // up, children in ascending index order.
  [[nodiscard]] std::vector<size_t> doubled_tree_walk(const distance::SpanningTree& tree);

  // Eulerian circuit of a connected multigraph whose vertices all have even
  // degree (Hierholzer). Neighbours are taken in ascending index order.
  [[nodiscard]] std::vector<size_t> eulerian_circuit(size_t n_vertices,
                                                     const std::vector<Edge>& edges, size_t start);

  // First occurrence of every vertex, in walk order.
  [[nodiscard]] std::vector<size_t> shortcut(const std::vector<size_t>& walk, size_t n_vertices);

  // Largest odd-vertex set matched exactly; larger sets use the greedy matcher.
  inline constexpr size_t EXACT_MATCHING_LIMIT = 20;

  // Minimum-weight perfect matching on an even-sized vertex set.
  [[nodiscard]] std::vector<Edge> min_weight_matching(const distance::DistanceMatrix& matrix,
                                                      const std::vector<size_t>& vertices);

  // Repeatedly pairs the lowest unmatched vertex with its nearest unmatched one.
  [[nodiscard]] std::vector<Edge> greedy_matching(const distance::DistanceMatrix& matrix,
                                                  const std::vector<size_t>& vertices);

  // Vertices with odd degree in the tree, ascending.
  [[nodiscard]] std::vector<size_t> odd_degree_vertices(const distance::SpanningTree& tree);

}  // namespace geoalloc::routing
