#include <algorithm>
#include <cmath>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/chunking.hpp>

namespace geoalloc::distance {

  std::vector<TableChunk> plan_chunks(size_t n_sources, size_t n_destinations,
                                      const TableLimits& limits) {
    if (limits.max_sources == 0 || limits.max_destinations == 0 || limits.max_elements == 0)
        [[unlikely]] {
      throw ValidationError("table limits must be positive", "max_table_size");
    }
    if (n_sources == 0 || n_destinations == 0) return {};

    size_t src_side = std::min(limits.max_sources, n_sources);
    if (src_side * std::min(limits.max_destinations, n_destinations) > limits.max_elements) {
      const auto root = static_cast<size_t>(std::sqrt(static_cast<double>(limits.max_elements)));
      src_side = std::max<size_t>(1, std::min(src_side, root));
    }
    const size_t dst_side = std::max<size_t>(
        1, std::min({limits.max_destinations, limits.max_elements / src_side, n_destinations}));

    std::vector<TableChunk> chunks;
    for (size_t s = 0; s < n_sources; s += src_side) {
      for (size_t d = 0; d < n_destinations; d += dst_side) {
        chunks.push_back({s, std::min(s + src_side, n_sources), d,
                          std::min(d + dst_side, n_destinations)});
      }
    }
    return chunks;
  }

}  // namespace geoalloc::distance
