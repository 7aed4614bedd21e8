#pragma once
#include <cstddef>
#include <geoalloc/common/matrix.hpp>
#include <optional>
#include <span>

namespace geoalloc::distance {

  // Square matrix of non-negative distances indexed by point order. Durations,
  // when requested from an external metric, live in a parallel matrix.
  struct DistanceMatrix {
    Matrix<double> distances;
    std::optional<Matrix<double>> durations;
    bool symmetric = true;

    [[nodiscard]] size_t size() const noexcept { return distances.rows(); }

    double operator()(size_t i, size_t j) const { return distances(i, j); }

    // Square shape, zero diagonal, finite non-negative cells, symmetry when
    // `symmetric` is set. Throws ValidationError naming the first bad cell.
    void validate() const;

    // Sub-matrix over `indices`, in that order.
    [[nodiscard]] DistanceMatrix subset(std::span<const size_t> indices) const;
  };

}  // namespace geoalloc::distance
