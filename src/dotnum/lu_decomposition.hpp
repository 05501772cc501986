#ifndef DOTNUM_LU_DECOMPOSITION_HPP
#define DOTNUM_LU_DECOMPOSITION_HPP

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>
#include "logging.hpp"
#include "matrix.hpp"
#include "matrix_error.hpp"

namespace dotnum {

// LU decomposition with partial (row) pivoting, Crout/Doolittle
// column-by-column form after Jama.
//
// For an m-by-n matrix A with m >= n this gives an m-by-n unit lower
// triangular L, an n-by-n upper triangular U and a row permutation piv so
// that A(piv, :) = L * U. The factorization always completes; a zero pivot
// only shows up through is_nonsingular().
//
// The input is copied at construction, later changes to the source matrix
// are not observed.
template <Numeric T>
class LUDecomposition {
 private:
  std::vector<T> LU_;  // L below the diagonal, U on and above it
  size_t m_;
  size_t n_;
  std::vector<size_t> piv_;
  int pivsign_;

  size_t index(size_t i, size_t j) const noexcept { return i * n_ + j; }

  void factorize() {
    using std::abs;
    const size_t m = m_;
    const size_t n = n_;

    for (size_t i = 0; i < m; ++i)
      piv_[i] = i;
    pivsign_ = 1;

    std::vector<T> LUcolj(m);

    for (size_t j = 0; j < n; ++j) {
      // Make a copy of the j-th column to localize references.
      for (size_t i = 0; i < m; ++i) {
        LUcolj[i] = LU_[index(i, j)];
      }

      // Apply previous transformations.
      for (size_t i = 0; i < m; ++i) {
        // Most of the time is spent in the following dot product.
        const size_t kmax = std::min(i, j);
        T s = T(0);
        for (size_t k = 0; k < kmax; ++k) {
          s += LU_[index(i, k)] * LUcolj[k];
        }
        LUcolj[i] -= s;
        LU_[index(i, j)] = LUcolj[i];
      }

      // Find pivot and exchange if necessary.
      size_t p = j;
      for (size_t i = j + 1; i < m; ++i) {
        if (abs(LUcolj[i]) > abs(LUcolj[p])) {
          p = i;
        }
      }
      if (p != j) {
        for (size_t k = 0; k < n; ++k) {
          std::swap(LU_[index(p, k)], LU_[index(j, k)]);
        }
        std::swap(piv_[p], piv_[j]);
        pivsign_ = -pivsign_;
      }

      // Compute multipliers.
      if (j < m && !(LU_[index(j, j)] == T(0))) {
        for (size_t i = j + 1; i < m; ++i) {
          LU_[index(i, j)] /= LU_[index(j, j)];
        }
      }
    }
  }

 public:
  // Same element type as the decomposition
  template <typename StoragePolicy>
  explicit LUDecomposition(const Matrix<T, StoragePolicy>& matrix)
      : LU_(matrix.array_copy()),
        m_(matrix.rows()),
        n_(matrix.cols()),
        piv_(matrix.rows()),
        pivsign_(1) {
    factorize();
    logger()->debug("LU decomposition of {}x{} matrix, pivot sign {}", m_,
                    n_, pivsign_);
  }

  // Converting form, e.g. a double matrix into a decimal decomposition
  template <Numeric U, typename StoragePolicy>
    requires(!std::is_same_v<U, T>)
  explicit LUDecomposition(const Matrix<U, StoragePolicy>& matrix)
      : m_(matrix.rows()), n_(matrix.cols()), piv_(matrix.rows()), pivsign_(1) {
    LU_.reserve(m_ * n_);
    for (size_t i = 0; i < m_; ++i)
      for (size_t j = 0; j < n_; ++j)
        LU_.push_back(static_cast<T>(matrix(i, j)));
    factorize();
    logger()->debug("LU decomposition of converted {}x{} matrix", m_, n_);
  }

  size_t rows() const noexcept { return m_; }
  size_t cols() const noexcept { return n_; }

  // False when U has an exactly zero diagonal entry. Non-square input is
  // never reported as nonsingular.
  bool is_nonsingular() const {
    if (m_ != n_)
      return false;
    for (size_t j = 0; j < n_; ++j) {
      if (LU_[index(j, j)] == T(0))
        return false;
    }
    return true;
  }

  // Unit lower triangular factor, m-by-min(m, n)
  Matrix<T> get_L() const {
    const size_t k = std::min(m_, n_);
    Matrix<T> result(m_, k);
    for (size_t i = 0; i < m_; ++i) {
      for (size_t j = 0; j < k; ++j) {
        if (i > j) {
          result(i, j) = LU_[index(i, j)];
        } else if (i == j) {
          result(i, j) = T(1);
        }
      }
    }
    return result;
  }

  // Upper triangular factor, min(m, n)-by-n
  Matrix<T> get_U() const {
    const size_t k = std::min(m_, n_);
    Matrix<T> result(k, n_);
    for (size_t i = 0; i < k; ++i) {
      for (size_t j = i; j < n_; ++j) {
        result(i, j) = LU_[index(i, j)];
      }
    }
    return result;
  }

  std::vector<size_t> pivot() const { return piv_; }

  std::vector<T> double_pivot() const {
    std::vector<T> vals(m_);
    for (size_t i = 0; i < m_; ++i)
      vals[i] = T(static_cast<long long>(piv_[i]));
    return vals;
  }

  int pivot_sign() const noexcept { return pivsign_; }

  T det() const {
    if (m_ != n_)
      throw not_square();
    T d = T(pivsign_);
    for (size_t j = 0; j < n_; ++j)
      d *= LU_[index(j, j)];
    return d;
  }

  // Solves A * X = B for X
  template <typename StoragePolicy>
  Matrix<T> solve(const Matrix<T, StoragePolicy>& B) const {
    if (B.rows() != m_)
      throw dimension_mismatch();
    if (!is_nonsingular())
      throw singular_matrix();

    const size_t n = n_;
    const size_t nx = B.cols();
    Matrix<T> X(n, nx);
    if (nx == 0)
      return X;

    // Copy right hand side with pivoting
    for (size_t i = 0; i < m_; ++i)
      for (size_t j = 0; j < nx; ++j)
        X(i, j) = B(piv_[i], j);

    // Solve L*Y = B(piv,:)
    for (size_t k = 0; k < n; ++k) {
      for (size_t i = k + 1; i < n; ++i) {
        for (size_t j = 0; j < nx; ++j) {
          X(i, j) -= X(k, j) * LU_[index(i, k)];
        }
      }
    }

    // Solve U*X = Y;
    for (size_t k = n; k-- > 0;) {
      for (size_t j = 0; j < nx; ++j) {
        X(k, j) /= LU_[index(k, k)];
      }
      for (size_t i = 0; i < k; ++i) {
        for (size_t j = 0; j < nx; ++j) {
          X(i, j) -= X(k, j) * LU_[index(i, k)];
        }
      }
    }
    return X;
  }
};

template <Numeric U, typename StoragePolicy>
LUDecomposition(const Matrix<U, StoragePolicy>&) -> LUDecomposition<U>;

}  // namespace dotnum

#endif  // DOTNUM_LU_DECOMPOSITION_HPP
