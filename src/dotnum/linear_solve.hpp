#ifndef DOTNUM_LINEAR_SOLVE_HPP
#define DOTNUM_LINEAR_SOLVE_HPP

#include "lu_decomposition.hpp"
#include "matrix.hpp"
#include "matrix_error.hpp"
#include "qr_decomposition.hpp"

namespace dotnum {

// Solution of A * X = B; least squares when A has more rows than columns
template <Numeric T, typename StoragePolicy>
Matrix<T> solve(const Matrix<T, StoragePolicy>& A,
                const Matrix<T, StoragePolicy>& B) {
  if (A.is_square())
    return LUDecomposition<T>(A).solve(B);
  return QRDecomposition<T>(A).solve(B);
}

// Solution of X * A = B
template <Numeric T, typename StoragePolicy>
Matrix<T> solve_transpose(const Matrix<T, StoragePolicy>& A,
                          const Matrix<T, StoragePolicy>& B) {
  return solve(A.transpose(), B.transpose()).transpose();
}

// Inverse, or pseudoinverse when A is taller than it is wide
template <Numeric T, typename StoragePolicy>
Matrix<T> inverse(const Matrix<T, StoragePolicy>& A) {
  return solve(A, Matrix<T, StoragePolicy>::identity(A.rows(), A.rows()));
}

template <Numeric T, typename StoragePolicy>
T det(const Matrix<T, StoragePolicy>& A) {
  return LUDecomposition<T>(A).det();
}

}  // namespace dotnum

#endif  // DOTNUM_LINEAR_SOLVE_HPP
