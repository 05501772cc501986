#ifndef DOTNUM_MATRIX_HPP
#define DOTNUM_MATRIX_HPP

#include <omp.h>
#include <algorithm>
#include <cassert>
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "StoragePolicy.hpp"
#include "library_config.hpp"
#include "matrix_error.hpp"

namespace dotnum {

// ==================== Matrix Class ====================
// Dense row-major matrix. Entry (i, j) lives at offset i * cols + j of one
// contiguous buffer for the whole lifetime of the object. Decompositions work
// on the raw buffer through index() and data().
template <Numeric T, typename StoragePolicy = DenseStorage<T>>
class Matrix {
 private:
  StoragePolicy storage_;

  // OpenMP only pays off for built-in types on reasonably large buffers
  static constexpr bool parallel_kernels =
      DOTNUM_OPENMP_ENABLED && std::is_arithmetic_v<T>;

  void check_matrix_dimensions(const Matrix& other) const {
    if (other.rows() != rows() || other.cols() != cols())
      throw dimension_mismatch();
  }

  // Runs op(k) for every flat offset k of the buffer
  template <typename Op>
  void for_each_offset(Op&& op) const {
    const size_t count = storage_.size();
    if constexpr (parallel_kernels) {
#pragma omp parallel for num_threads(ThreadCount) if (count >= OPENMP_MIN_ENTRIES)
      for (size_t k = 0; k < count; ++k) {
        op(k);
      }
    } else {
      for (size_t k = 0; k < count; ++k) {
        op(k);
      }
    }
  }

 public:
  using value_type = T;
  using storage_type = StoragePolicy;

  // ===== Constructors =====

  // Default constructor - empty matrix
  Matrix() : storage_(0, 0) {}

  // Size constructor with optional initial value
  Matrix(size_t rows, size_t cols, T init_val = T(0))
      : storage_(rows, cols, init_val) {}

  //constructor to create matrix from row-major std::vector
  Matrix(size_t rows, size_t cols, std::vector<T> data) {
    if (data.size() != rows * cols) {
      throw bad_argument();
    }
    storage_ = StoragePolicy(std::move(data), rows, cols);
  }

  // Initializer list constructor
  Matrix(std::initializer_list<std::initializer_list<T>> init) {
    const size_t rows = init.size();
    const size_t cols = rows == 0 ? 0 : init.begin()->size();
    storage_ = StoragePolicy(rows, cols);

    size_t i = 0;
    for (const auto& row : init) {
      if (row.size() != cols)
        throw bad_argument();
      size_t j = 0;
      for (const auto& val : row) {
        operator()(i, j) = val;
        ++j;
      }
      ++i;
    }
  }

  //constructor for converting one type to other
  template <Numeric U, typename OtherStorage>
  explicit Matrix(const Matrix<U, OtherStorage>& other)
      : storage_(other.rows(), other.cols()) {
    for (size_t i = 0; i < rows(); ++i) {
      for (size_t j = 0; j < cols(); ++j) {
        operator()(i, j) = static_cast<T>(other(i, j));
      }
    }
  }

  Matrix(const Matrix& other) = default;
  Matrix(Matrix&& other) noexcept = default;
  Matrix& operator=(const Matrix& other) = default;
  Matrix& operator=(Matrix&& other) noexcept = default;

  // ===== Size Information =====
  size_t rows() const noexcept { return storage_.rows(); }
  size_t cols() const noexcept { return storage_.cols(); }
  size_t size() const noexcept { return rows() * cols(); }

  bool empty() const noexcept { return rows() == 0 || cols() == 0; }
  bool is_square() const noexcept { return rows() == cols(); }

  // Exact symmetry, the same test the eigenvalue decomposition uses to pick
  // its path
  bool is_symmetric() const {
    if (!is_square())
      return false;

    for (size_t i = 0; i < rows(); ++i)
      for (size_t j = i + 1; j < cols(); ++j)
        if (!(operator()(i, j) == operator()(j, i)))
          return false;

    return true;
  }

  // ===== Element Access =====

  size_t index(size_t row, size_t col) const noexcept {
    return row * storage_.stride() + col;
  }

  T& operator()(size_t row, size_t col) {
    assert(row < rows() && col < cols() && "Matrix index out of bounds");
    return storage_.get(row, col);
  }

  const T& operator()(size_t row, size_t col) const {
    assert(row < rows() && col < cols() && "Matrix index out of bounds");
    return storage_.get(row, col);
  }

  const T& get(size_t row, size_t col) const { return operator()(row, col); }

  void set(size_t row, size_t col, const T& value) {
    operator()(row, col) = value;
  }

  T& at(size_t row, size_t col) {
    if (row >= rows() || col >= cols())
      throw out_of_range();
    return operator()(row, col);
  }

  const T& at(size_t row, size_t col) const {
    if (row >= rows() || col >= cols())
      throw out_of_range();
    return operator()(row, col);
  }

  T* data() noexcept { return storage_.data(); }
  const T* data() const noexcept { return storage_.data(); }

  // Independent copy of the row-major buffer
  std::vector<T> array_copy() const {
    return std::vector<T>(data(), data() + size());
  }

  // ===== Sub-matrices =====

  // Rows i0..i1 and columns j0..j1, both ranges inclusive
  Matrix get_matrix(size_t i0, size_t i1, size_t j0, size_t j1) const {
    if (i1 < i0 || j1 < j0 || i1 >= rows() || j1 >= cols())
      throw out_of_range();
    Matrix result(i1 - i0 + 1, j1 - j0 + 1);
    for (size_t i = i0; i <= i1; ++i) {
      for (size_t j = j0; j <= j1; ++j) {
        result(i - i0, j - j0) = operator()(i, j);
      }
    }
    return result;
  }

  // Gathers the listed rows (in order) restricted to columns j0..j1
  Matrix get_array_row_matrix(const std::vector<size_t>& r, size_t j0,
                              size_t j1) const {
    if (j1 < j0 || j1 >= cols())
      throw out_of_range();
    Matrix result(r.size(), j1 - j0 + 1);
    for (size_t i = 0; i < r.size(); ++i) {
      if (r[i] >= rows())
        throw out_of_range();
      for (size_t j = j0; j <= j1; ++j) {
        result(i, j - j0) = operator()(r[i], j);
      }
    }
    return result;
  }

  // ===== Basic Matrix Operations =====

  Matrix transpose() const {
    const size_t m = rows();
    const size_t n = cols();
    Matrix result(n, m);
    const size_t block_size = BLOCK_SIZE;

    if constexpr (parallel_kernels) {
#pragma omp parallel for num_threads(ThreadCount) collapse(2) if (m * n >= OPENMP_MIN_ENTRIES)
      for (size_t i_outer = 0; i_outer < m; i_outer += block_size) {
        for (size_t j_outer = 0; j_outer < n; j_outer += block_size) {
          size_t i_end = std::min(i_outer + block_size, m);
          size_t j_end = std::min(j_outer + block_size, n);
          for (size_t i = i_outer; i < i_end; ++i) {
            for (size_t j = j_outer; j < j_end; ++j) {
              result(j, i) = operator()(i, j);
            }
          }
        }
      }
    } else {
      for (size_t i = 0; i < m; ++i) {
        for (size_t j = 0; j < n; ++j) {
          result(j, i) = operator()(i, j);
        }
      }
    }
    return result;
  }

  Matrix operator+(const Matrix& rhs) const {
    check_matrix_dimensions(rhs);
    Matrix result(rows(), cols());
    const T* a = data();
    const T* b = rhs.data();
    T* out = result.data();
    for_each_offset([&](size_t k) { out[k] = a[k] + b[k]; });
    return result;
  }

  Matrix operator-(const Matrix& rhs) const {
    check_matrix_dimensions(rhs);
    Matrix result(rows(), cols());
    const T* a = data();
    const T* b = rhs.data();
    T* out = result.data();
    for_each_offset([&](size_t k) { out[k] = a[k] - b[k]; });
    return result;
  }

  Matrix operator-() const {
    Matrix result(rows(), cols());
    const T* a = data();
    T* out = result.data();
    for_each_offset([&](size_t k) { out[k] = -a[k]; });
    return result;
  }

  Matrix& operator+=(const Matrix& rhs) {
    check_matrix_dimensions(rhs);
    T* a = data();
    const T* b = rhs.data();
    for_each_offset([&](size_t k) { a[k] += b[k]; });
    return *this;
  }

  Matrix& operator-=(const Matrix& rhs) {
    check_matrix_dimensions(rhs);
    T* a = data();
    const T* b = rhs.data();
    for_each_offset([&](size_t k) { a[k] -= b[k]; });
    return *this;
  }

  Matrix operator*(const Matrix& rhs) const {
    if (cols() != rhs.rows()) {
      throw dimension_mismatch();
    }

    const size_t m = rows();
    const size_t inner = cols();
    const size_t n = rhs.cols();
    const size_t block_size = BLOCK_SIZE;

    Matrix result(m, n, T(0));

    if constexpr (parallel_kernels) {
#pragma omp parallel for num_threads(ThreadCount) if (m * n >= OPENMP_MIN_ENTRIES)
      for (size_t i_outer = 0; i_outer < m; i_outer += block_size) {
        size_t i_end = std::min(i_outer + block_size, m);
        for (size_t k_outer = 0; k_outer < inner; k_outer += block_size) {
          size_t k_end = std::min(k_outer + block_size, inner);
          for (size_t j_outer = 0; j_outer < n; j_outer += block_size) {
            size_t j_end = std::min(j_outer + block_size, n);
            for (size_t i = i_outer; i < i_end; ++i) {
              for (size_t k = k_outer; k < k_end; ++k) {
                T a = operator()(i, k);
                for (size_t j = j_outer; j < j_end; ++j) {
                  result(i, j) += a * rhs(k, j);
                }
              }
            }
          }
        }
      }
    } else {
      for (size_t i = 0; i < m; ++i) {
        for (size_t k = 0; k < inner; ++k) {
          T a = operator()(i, k);
          for (size_t j = 0; j < n; ++j) {
            result(i, j) += a * rhs(k, j);
          }
        }
      }
    }

    return result;
  }

  Matrix operator*(const T& scalar) const {
    Matrix result(rows(), cols());
    const T* a = data();
    T* out = result.data();
    for_each_offset([&](size_t k) { out[k] = scalar * a[k]; });
    return result;
  }

  Matrix& operator*=(const T& scalar) {
    T* a = data();
    for_each_offset([&](size_t k) { a[k] *= scalar; });
    return *this;
  }

  // =====  Element-wise products and quotients =====
  Matrix array_times(const Matrix& rhs) const {
    Matrix result = *this;
    return result.array_times_equals(rhs);
  }

  Matrix& array_times_equals(const Matrix& rhs) {
    check_matrix_dimensions(rhs);
    T* a = data();
    const T* b = rhs.data();
    for_each_offset([&](size_t k) { a[k] *= b[k]; });
    return *this;
  }

  // this ./ rhs
  Matrix array_right_divide(const Matrix& rhs) const {
    Matrix result = *this;
    return result.array_right_divide_equals(rhs);
  }

  Matrix& array_right_divide_equals(const Matrix& rhs) {
    check_matrix_dimensions(rhs);
    T* a = data();
    const T* b = rhs.data();
    for_each_offset([&](size_t k) { a[k] = a[k] / b[k]; });
    return *this;
  }

  // rhs ./ this
  Matrix array_left_divide(const Matrix& rhs) const {
    Matrix result = *this;
    return result.array_left_divide_equals(rhs);
  }

  Matrix& array_left_divide_equals(const Matrix& rhs) {
    check_matrix_dimensions(rhs);
    T* a = data();
    const T* b = rhs.data();
    for_each_offset([&](size_t k) { a[k] = b[k] / a[k]; });
    return *this;
  }

  // Linear interpolation towards rhs: ratio 0 keeps this, ratio 1 gives rhs.
  // The ratio is not clamped.
  Matrix& blend_equals(const Matrix& rhs, const T& ratio) {
    check_matrix_dimensions(rhs);
    T* a = data();
    const T* b = rhs.data();
    for_each_offset([&](size_t k) { a[k] = a[k] + (b[k] - a[k]) * ratio; });
    return *this;
  }

  // ===== Reductions =====

  T trace() const {
    T t = T(0);
    for (size_t i = 0; i < std::min(rows(), cols()); ++i)
      t += operator()(i, i);
    return t;
  }

  // Maximum column sum
  T norm1() const {
    using std::abs;
    T f = T(0);
    for (size_t j = 0; j < cols(); ++j) {
      T s = T(0);
      for (size_t i = 0; i < rows(); ++i)
        s += abs(operator()(i, j));
      if (f < s)
        f = s;
    }
    return f;
  }

  // Maximum row sum
  T norm_inf() const {
    using std::abs;
    T f = T(0);
    for (size_t i = 0; i < rows(); ++i) {
      T s = T(0);
      for (size_t j = 0; j < cols(); ++j)
        s += abs(operator()(i, j));
      if (f < s)
        f = s;
    }
    return f;
  }

  // Frobenius norm
  T norm_f() const {
    T f = T(0);
    for (size_t k = 0; k < size(); ++k)
      f = hypot(f, data()[k]);
    return f;
  }

  // ===== Static Factory Methods =====

  static Matrix zeros(size_t rows, size_t cols) { return Matrix(rows, cols); }

  static Matrix identity(size_t m, size_t n) {
    Matrix result(m, n);
    for (size_t i = 0; i < std::min(m, n); ++i)
      result(i, i) = T(1);
    return result;
  }

  static Matrix identity(size_t n) { return identity(n, n); }

  static Matrix diagonal_matrix(const std::vector<T>& elements) {
    const size_t n = elements.size();
    Matrix result(n, n);
    for (size_t i = 0; i < n; ++i)
      result(i, i) = elements[i];
    return result;
  }

  static Matrix row_vector(const std::vector<T>& elements) {
    return Matrix(1, elements.size(), elements);
  }

  static Matrix column_vector(const std::vector<T>& elements) {
    return Matrix(elements.size(), 1, elements);
  }

  // sqrt(a^2 + b^2) without under/overflow
  static T hypot(const T& a, const T& b) {
    using std::abs;
    using std::sqrt;
    T r;
    if (abs(a) > abs(b)) {
      r = b / a;
      r = abs(a) * sqrt(T(1) + r * r);
    } else if (!(b == T(0))) {
      r = a / b;
      r = abs(b) * sqrt(T(1) + r * r);
    } else {
      r = T(0);
    }
    return r;
  }

  std::string to_string() const {
    std::ostringstream os;
    os << "dim: " << rows() << "x" << cols() << "\n";
    for (size_t i = 0; i < rows(); ++i) {
      for (size_t j = 0; j < cols(); ++j) {
        os << operator()(i, j) << " ";
      }
      os << "\n";
    }
    return os.str();
  }

  //end of class
};

// ==================== Free Functions ====================

// Output stream operator for matrices
template <Numeric T, typename StoragePolicy>
std::ostream& operator<<(std::ostream& os, const Matrix<T, StoragePolicy>& m) {
  os << "[";
  for (size_t i = 0; i < m.rows(); ++i) {
    os << (i == 0 ? "[" : " [");
    for (size_t j = 0; j < m.cols(); ++j) {
      os << m(i, j);
      if (j < m.cols() - 1)
        os << ", ";
    }
    os << "]";
    if (i < m.rows() - 1)
      os << ",\n";
  }
  os << "]";
  return os;
}

// Scalar multiplication (scalar on left side)
template <Numeric T, typename StoragePolicy>
Matrix<T, StoragePolicy> operator*(const T& scalar,
                                   const Matrix<T, StoragePolicy>& m) {
  return m * scalar;
}

}  // namespace dotnum
#endif  // DOTNUM_MATRIX_HPP
