#include <fmt/format.h>

#include <cmath>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/distance_matrix.hpp>

namespace geoalloc::distance {

  void DistanceMatrix::validate() const {
    if (!distances.square()) [[unlikely]] {
      throw ValidationError(
          fmt::format("distance matrix must be square, got {}x{}", distances.rows(),
                      distances.cols()));
    }
    if (durations && (durations->rows() != size() || durations->cols() != size())) [[unlikely]] {
      throw ValidationError("duration matrix shape does not match distance matrix");
    }

    const size_t n = size();
    for (size_t i = 0; i < n; ++i) {
      if (distances(i, i) != 0.0) {
        throw ValidationError(
            fmt::format("distance matrix diagonal must be zero, M[{0}][{0}] = {1}", i,
                        distances(i, i)),
            std::to_string(i));
      }
      for (size_t j = 0; j < n; ++j) {
        const double d = distances(i, j);
        if (!std::isfinite(d) || d < 0.0) {
          throw ValidationError(fmt::format("invalid distance M[{}][{}] = {}", i, j, d),
                                std::to_string(i));
        }
        if (symmetric && d != distances(j, i)) {
          throw ValidationError(
              fmt::format("asymmetric distance M[{0}][{1}] = {2}, M[{1}][{0}] = {3}", i, j, d,
                          distances(j, i)),
              std::to_string(i));
        }
      }
    }
  }

  DistanceMatrix DistanceMatrix::subset(std::span<const size_t> indices) const {
    const size_t m = indices.size();
    DistanceMatrix out;
    out.symmetric = symmetric;
    out.distances.resize(m, m);
    if (durations) out.durations.emplace(m, m);

    for (size_t a = 0; a < m; ++a) {
      for (size_t b = 0; b < m; ++b) {
        out.distances(a, b) = distances(indices[a], indices[b]);
        if (durations) (*out.durations)(a, b) = (*durations)(indices[a], indices[b]);
      }
    }
    return out;
  }

}  // namespace geoalloc::distance
