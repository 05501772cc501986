#ifndef DOTNUM_STORAGE_POLICY_HPP
#define DOTNUM_STORAGE_POLICY_HPP
#include <cstddef>
#include <utility>
#include <vector>
#include "types.hpp"

namespace dotnum {

// ==================== Storage Policies ====================
// Contiguous row-major storage. Copying a DenseStorage copies the buffer, so
// a Matrix built on it has value semantics.
template <Numeric T>
class DenseStorage {
 private:
  std::vector<T> data_;
  size_t rows_;
  size_t cols_;

 public:
  DenseStorage() : rows_(0), cols_(0) {}

  DenseStorage(size_t rows, size_t cols, T init_val = T(0))
      : data_(rows * cols, init_val), rows_(rows), cols_(cols) {}

  // Adopt an already filled buffer of rows * cols entries
  DenseStorage(std::vector<T> data, size_t rows, size_t cols)
      : data_(std::move(data)), rows_(rows), cols_(cols) {}

  T& get(size_t row, size_t col) { return data_[row * cols_ + col]; }

  const T& get(size_t row, size_t col) const {
    return data_[row * cols_ + col];
  }

  size_t rows() const noexcept { return rows_; }
  size_t cols() const noexcept { return cols_; }
  size_t stride() const noexcept { return cols_; }
  size_t size() const noexcept { return data_.size(); }

  T* data() noexcept { return data_.data(); }
  const T* data() const noexcept { return data_.data(); }
};

}  // namespace dotnum
#endif
