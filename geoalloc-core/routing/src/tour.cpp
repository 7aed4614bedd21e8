#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <cstdint>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/routing/tour.hpp>
#include <limits>

namespace geoalloc::routing {

  std::vector<size_t> doubled_tree_walk(const distance::SpanningTree& tree) {
    if (tree.size() == 0) return {};

    std::vector<size_t> walk{tree.root};
    std::vector<std::pair<size_t, size_t>> stack{{tree.root, 0}};
    while (!stack.empty()) {
      auto& [u, next] = stack.back();
      if (next < tree.children[u].size()) {
        const size_t v = tree.children[u][next++];
        walk.push_back(v);
        stack.emplace_back(v, 0);
      } else {
        stack.pop_back();
        if (!stack.empty()) walk.push_back(stack.back().first);
      }
    }
    return walk;
  }

  std::vector<size_t> eulerian_circuit(size_t n_vertices, const std::vector<Edge>& edges,
                                       size_t start) {
    GEOALLOC_ZONE;
    // (neighbour, edge id), sorted so lower neighbours are taken first.
    std::vector<std::vector<std::pair<size_t, size_t>>> adj(n_vertices);
    for (size_t e = 0; e < edges.size(); ++e) {
      adj[edges[e].first].emplace_back(edges[e].second, e);
      adj[edges[e].second].emplace_back(edges[e].first, e);
    }
    for (auto& a : adj) std::sort(a.begin(), a.end());

    std::vector<bool> used(edges.size(), false);
    std::vector<size_t> next(n_vertices, 0);
    std::vector<size_t> stack{start};
    std::vector<size_t> circuit;
    circuit.reserve(edges.size() + 1);

    while (!stack.empty()) {
      const size_t u = stack.back();
      while (next[u] < adj[u].size() && used[adj[u][next[u]].second]) ++next[u];
      if (next[u] < adj[u].size()) {
        const auto [v, e] = adj[u][next[u]];
        used[e] = true;
        stack.push_back(v);
      } else {
        circuit.push_back(u);
        stack.pop_back();
      }
    }

    if (circuit.size() != edges.size() + 1) {
      throw SolverError("route", n_vertices, "tour multigraph is not connected");
    }
    std::reverse(circuit.begin(), circuit.end());
    return circuit;
  }

  std::vector<size_t> shortcut(const std::vector<size_t>& walk, size_t n_vertices) {
    std::vector<bool> visited(n_vertices, false);
    std::vector<size_t> order;
    order.reserve(n_vertices);
    for (size_t v : walk) {
      if (!visited[v]) {
        visited[v] = true;
        order.push_back(v);
      }
    }
    return order;
  }

  std::vector<size_t> odd_degree_vertices(const distance::SpanningTree& tree) {
    std::vector<size_t> odd;
    for (size_t v = 0; v < tree.size(); ++v) {
      const size_t degree
          = tree.children[v].size() + (tree.parent[v] != distance::SpanningTree::npos ? 1 : 0);
      if (degree % 2 == 1) odd.push_back(v);
    }
    return odd;
  }

  std::vector<Edge> greedy_matching(const distance::DistanceMatrix& matrix,
                                    const std::vector<size_t>& vertices) {
    std::vector<bool> matched(vertices.size(), false);
    std::vector<Edge> out;
    for (size_t a = 0; a < vertices.size(); ++a) {
      if (matched[a]) continue;
      size_t best = vertices.size();
      for (size_t b = a + 1; b < vertices.size(); ++b) {
        if (matched[b]) continue;
        if (best == vertices.size()
            || distance::edge_weight(matrix, vertices[a], vertices[b])
                   < distance::edge_weight(matrix, vertices[a], vertices[best])) {
          best = b;
        }
      }
      if (best == vertices.size()) break;
      matched[a] = matched[best] = true;
      out.emplace_back(vertices[a], vertices[best]);
    }
    return out;
  }

  std::vector<Edge> min_weight_matching(const distance::DistanceMatrix& matrix,
                                        const std::vector<size_t>& vertices) {
    GEOALLOC_ZONE;
    const size_t m = vertices.size();
    if (m % 2 != 0) [[unlikely]] {
      throw SolverError("route", matrix.size(),
                        fmt::format("perfect matching needs an even vertex count, got {}", m));
    }
    if (m > EXACT_MATCHING_LIMIT) {
      logger()->debug("{} odd-degree vertices, using greedy matching", m);
      return greedy_matching(matrix, vertices);
    }
    if (m == 0) return {};

    // dp[mask]: cheapest perfect matching of the vertices in mask. The lowest
    // vertex of each mask is matched first; ties keep the lower partner.
    const uint32_t full = (uint32_t{1} << m) - 1;
    constexpr double inf = std::numeric_limits<double>::infinity();
    std::vector<double> dp(size_t{full} + 1, inf);
    std::vector<uint8_t> partner(size_t{full} + 1, 0);
    dp[0] = 0.0;

    for (uint32_t mask = 1; mask <= full; ++mask) {
      if (std::popcount(mask) % 2 != 0) continue;
      const int i = std::countr_zero(mask);
      for (int j = i + 1; j < static_cast<int>(m); ++j) {
        if (!(mask & (uint32_t{1} << j))) continue;
        const uint32_t rest = mask & ~(uint32_t{1} << i) & ~(uint32_t{1} << j);
        const double cost = dp[rest] + distance::edge_weight(matrix, vertices[i], vertices[j]);
        if (cost < dp[mask]) {
          dp[mask] = cost;
          partner[mask] = static_cast<uint8_t>(j);
        }
      }
    }

    std::vector<Edge> out;
    for (uint32_t mask = full; mask != 0;) {
      const int i = std::countr_zero(mask);
      const int j = partner[mask];
      out.emplace_back(vertices[i], vertices[j]);
      mask &= ~(uint32_t{1} << i) & ~(uint32_t{1} << j);
    }
    return out;
  }

}  // namespace geoalloc::routing
