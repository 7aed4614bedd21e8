#pragma once
#include <algorithm>
#include <cstddef>
#include <vector>

namespace geoalloc {

  // Dense row-major matrix. Distance, duration and cross matrices all use it.
  template <typename T> class Matrix {
  public:
    using value_type = T;

    Matrix() = default;

    Matrix(size_t rows, size_t cols) : rows_(rows), cols_(cols), data_(rows * cols) {}

    Matrix(size_t rows, size_t cols, T fill)
        : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

    Matrix(size_t rows, size_t cols, const T* src)
        : rows_(rows), cols_(cols), data_(src, src + rows * cols) {}

    [[nodiscard]] size_t rows() const noexcept { return rows_; }
    [[nodiscard]] size_t cols() const noexcept { return cols_; }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }
    [[nodiscard]] bool square() const noexcept { return rows_ == cols_; }

    [[nodiscard]] T* data() noexcept { return data_.data(); }
    [[nodiscard]] const T* data() const noexcept { return data_.data(); }

    T& operator()(size_t row, size_t col) { return data_[row * cols_ + col]; }
    const T& operator()(size_t row, size_t col) const { return data_[row * cols_ + col]; }

    [[nodiscard]] const T* row(size_t r) const noexcept { return data_.data() + r * cols_; }

    void resize(size_t rows, size_t cols) {
      rows_ = rows;
      cols_ = cols;
      data_.resize(rows * cols);
    }

    void fill(T value) { std::fill(data_.begin(), data_.end(), value); }

    bool operator==(const Matrix&) const = default;

  private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<T> data_;
  };

}  // namespace geoalloc
