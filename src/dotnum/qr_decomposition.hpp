#ifndef DOTNUM_QR_DECOMPOSITION_HPP
#define DOTNUM_QR_DECOMPOSITION_HPP

#include <vector>
#include "logging.hpp"
#include "matrix.hpp"
#include "matrix_error.hpp"

namespace dotnum {

// Householder QR decomposition after Jama.
//
// For an m-by-n matrix A with m >= n, A = Q * R with Q m-by-n having
// orthonormal columns and R n-by-n upper triangular. The Householder vectors
// are kept in the lower trapezoid of QR_, the diagonal of R in Rdiag_.
// When m < n the trailing columns get no reflector and the decomposition is
// reported as rank deficient.
template <Numeric T>
class QRDecomposition {
 private:
  std::vector<T> QR_;
  size_t m_;
  size_t n_;
  std::vector<T> Rdiag_;

  size_t index(size_t i, size_t j) const noexcept { return i * n_ + j; }

 public:
  template <typename StoragePolicy>
  explicit QRDecomposition(const Matrix<T, StoragePolicy>& matrix)
      : QR_(matrix.array_copy()),
        m_(matrix.rows()),
        n_(matrix.cols()),
        Rdiag_(matrix.cols()) {
    const size_t m = m_;
    const size_t n = n_;

    // Main loop.
    for (size_t k = 0; k < n; ++k) {
      // Compute 2-norm of k-th column without under/overflow.
      T nrm = T(0);
      for (size_t i = k; i < m; ++i) {
        nrm = Matrix<T>::hypot(nrm, QR_[index(i, k)]);
      }

      if (!(nrm == T(0))) {
        // Form k-th Householder vector.
        if (QR_[index(k, k)] < T(0)) {
          nrm = -nrm;
        }
        for (size_t i = k; i < m; ++i) {
          QR_[index(i, k)] /= nrm;
        }
        QR_[index(k, k)] += T(1);

        // Apply transformation to remaining columns.
        for (size_t j = k + 1; j < n; ++j) {
          T s = T(0);
          for (size_t i = k; i < m; ++i) {
            s += QR_[index(i, k)] * QR_[index(i, j)];
          }
          s = -s / QR_[index(k, k)];
          for (size_t i = k; i < m; ++i) {
            QR_[index(i, j)] += s * QR_[index(i, k)];
          }
        }
      }
      Rdiag_[k] = -nrm;
    }
    logger()->debug("QR decomposition of {}x{} matrix", m_, n_);
  }

  size_t rows() const noexcept { return m_; }
  size_t cols() const noexcept { return n_; }

  bool is_full_rank() const {
    for (size_t j = 0; j < n_; ++j) {
      if (Rdiag_[j] == T(0))
        return false;
    }
    return true;
  }

  // Householder vectors, lower trapezoidal m-by-n
  Matrix<T> get_H() const {
    Matrix<T> result(m_, n_);
    for (size_t i = 0; i < m_; ++i) {
      for (size_t j = 0; j <= i && j < n_; ++j) {
        result(i, j) = QR_[index(i, j)];
      }
    }
    return result;
  }

  // Upper triangular factor, n-by-n
  Matrix<T> get_R() const {
    Matrix<T> result(n_, n_);
    for (size_t i = 0; i < n_; ++i) {
      result(i, i) = Rdiag_[i];
      if (i >= m_)
        continue;
      for (size_t j = i + 1; j < n_; ++j) {
        result(i, j) = QR_[index(i, j)];
      }
    }
    return result;
  }

  // Orthogonal factor, m-by-n, built by applying the reflectors backwards
  Matrix<T> get_Q() const {
    Matrix<T> result(m_, n_);
    for (size_t k = n_; k-- > 0;) {
      if (k >= m_)
        continue;
      result(k, k) = T(1);
      if (QR_[index(k, k)] == T(0))
        continue;
      for (size_t j = k; j < n_; ++j) {
        T s = T(0);
        for (size_t i = k; i < m_; ++i) {
          s += QR_[index(i, k)] * result(i, j);
        }
        s = -s / QR_[index(k, k)];
        for (size_t i = k; i < m_; ++i) {
          result(i, j) += s * QR_[index(i, k)];
        }
      }
    }
    return result;
  }

  // Least squares solution of A * X = B, n-by-nx
  template <typename StoragePolicy>
  Matrix<T> solve(const Matrix<T, StoragePolicy>& B) const {
    if (B.rows() != m_)
      throw dimension_mismatch();
    if (!is_full_rank())
      throw rank_deficient();

    const size_t nx = B.cols();
    Matrix<T> X(m_, nx, B.array_copy());
    if (nx == 0 || n_ == 0)
      return Matrix<T>(n_, nx);

    // Compute Y = transpose(Q)*B
    for (size_t k = 0; k < n_; ++k) {
      for (size_t j = 0; j < nx; ++j) {
        T s = T(0);
        for (size_t i = k; i < m_; ++i) {
          s += QR_[index(i, k)] * X(i, j);
        }
        s = -s / QR_[index(k, k)];
        for (size_t i = k; i < m_; ++i) {
          X(i, j) += s * QR_[index(i, k)];
        }
      }
    }

    // Solve R*X = Y;
    for (size_t k = n_; k-- > 0;) {
      for (size_t j = 0; j < nx; ++j) {
        X(k, j) /= Rdiag_[k];
      }
      for (size_t i = 0; i < k; ++i) {
        for (size_t j = 0; j < nx; ++j) {
          X(i, j) -= X(k, j) * QR_[index(i, k)];
        }
      }
    }
    return X.get_matrix(0, n_ - 1, 0, nx - 1);
  }
};

template <Numeric U, typename StoragePolicy>
QRDecomposition(const Matrix<U, StoragePolicy>&) -> QRDecomposition<U>;

}  // namespace dotnum

#endif  // DOTNUM_QR_DECOMPOSITION_HPP
