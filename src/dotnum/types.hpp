#ifndef DOTNUM_TYPES_HPP
#define DOTNUM_TYPES_HPP
#include <concepts>
#include <cstddef>
#include <type_traits>
namespace dotnum {
// Anything closed under the four field operations and constructible from an
// int. Covers built-in types and Boost.Multiprecision numbers.
template <typename T>
concept Numeric = requires(T a, T b) {
  { T(0) };
  { T(a + b) } -> std::same_as<T>;
  { T(a - b) } -> std::same_as<T>;
  { T(a * b) } -> std::same_as<T>;
  { T(a / b) } -> std::same_as<T>;
  { a < b } -> std::convertible_to<bool>;
  { a == b } -> std::convertible_to<bool>;
};

// Forward declarations
template <Numeric T>
class DenseStorage;

template <Numeric T, typename StoragePolicy>
class Matrix;

template <Numeric T>
class LUDecomposition;

template <Numeric T>
class QRDecomposition;

class Complex;
class EigenvalueDecomposition;
class UnivariatePolynomial;

// Which reduction the eigenvalue decomposition runs
enum class EigenPath {
  Symmetric,    // Householder tridiagonal + implicit QL
  Nonsymmetric  // Hessenberg + real Schur QR
};

// How roots of degree >= 4 polynomials are extracted from the companion matrix
enum class RootMethod {
  EigenDecomposition,  // Full Hessenberg/Schur decomposition (complex pairs)
  UnshiftedQR          // Plain A <- R*Q iteration, real diagonal only
};
}  // namespace dotnum
#endif
