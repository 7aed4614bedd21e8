#pragma once
#include <algorithm>
#include <cstddef>
#include <geoalloc/distance/distance_matrix.hpp>
#include <limits>
#include <vector>

namespace geoalloc::distance {

  struct SpanningTree {
    static constexpr size_t npos = std::numeric_limits<size_t>::max();

    size_t root = 0;
    std::vector<size_t> parent;                 // npos for the root
    std::vector<std::vector<size_t>> children;  // ascending index
    double weight = 0.0;

    [[nodiscard]] size_t size() const noexcept { return parent.size(); }
  };

  // Weight of the undirected edge {i, j}; the cheaper direction for directed matrices.
  [[nodiscard]] inline double edge_weight(const DistanceMatrix& m, size_t i, size_t j) {
    if (m.symmetric) return m(i, j);
    return std::min(m(i, j), m(j, i));
  }

  // Prim's algorithm grown from `root`. Among equal candidate edges the vertex
  // with the smaller index joins first, and it attaches to the smaller-index parent.
  [[nodiscard]] SpanningTree minimum_spanning_tree(const DistanceMatrix& m, size_t root = 0);

}  // namespace geoalloc::distance
