#include <fmt/format.h>

#include <algorithm>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/distance/spanning_tree.hpp>
#include <limits>

namespace geoalloc::distance {

  SpanningTree minimum_spanning_tree(const DistanceMatrix& m, size_t root) {
    GEOALLOC_ZONE;
    const size_t n = m.size();
    SpanningTree tree;
    tree.parent.assign(n, SpanningTree::npos);
    tree.children.resize(n);
    if (n == 0) return tree;
    if (root >= n) [[unlikely]] {
      throw ValidationError(fmt::format("tree root {} out of range for {} points", root, n));
    }
    tree.root = root;

    constexpr double inf = std::numeric_limits<double>::infinity();
    std::vector<double> best(n, inf);
    std::vector<size_t> via(n, SpanningTree::npos);
    std::vector<bool> in_tree(n, false);
    best[root] = 0.0;

    for (size_t step = 0; step < n; ++step) {
      size_t u = SpanningTree::npos;
      for (size_t v = 0; v < n; ++v) {
        if (!in_tree[v] && (u == SpanningTree::npos || best[v] < best[u])) u = v;
      }
      in_tree[u] = true;
      if (via[u] != SpanningTree::npos) {
        tree.parent[u] = via[u];
        tree.children[via[u]].push_back(u);
        tree.weight += best[u];
      }
      for (size_t v = 0; v < n; ++v) {
        if (in_tree[v]) continue;
        const double w = edge_weight(m, u, v);
        // Strict comparison keeps the earliest (and on ties smallest) parent.
        if (w < best[v] || (w == best[v] && via[v] != SpanningTree::npos && u < via[v])) {
          best[v] = w;
          via[v] = u;
        }
      }
    }

    for (auto& c : tree.children) std::sort(c.begin(), c.end());
    return tree;
  }

}  // namespace geoalloc::distance
