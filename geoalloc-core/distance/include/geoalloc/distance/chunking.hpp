#pragma once
#include <cstddef>
#include <vector>

namespace geoalloc::distance {

  struct TableLimits {
    size_t max_sources;
    size_t max_destinations;
    size_t max_elements;
  };

  // Half-open source and destination ranges of one table request.
  struct TableChunk {
    size_t src_begin;
    size_t src_end;
    size_t dst_begin;
    size_t dst_end;

    [[nodiscard]] size_t sources() const noexcept { return src_end - src_begin; }
    [[nodiscard]] size_t destinations() const noexcept { return dst_end - dst_begin; }

    bool operator==(const TableChunk&) const = default;
  };

  // Tiles an n_sources x n_destinations table with chunks inside `limits`.
  // Every cell is covered by exactly one chunk.
  [[nodiscard]] std::vector<TableChunk> plan_chunks(size_t n_sources, size_t n_destinations,
                                                    const TableLimits& limits);

}  // namespace geoalloc::distance
