#ifndef DOTNUM_UNIVARIATE_POLYNOMIAL_HPP
#define DOTNUM_UNIVARIATE_POLYNOMIAL_HPP

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "complex.hpp"
#include "eigenvalue_decomposition.hpp"
#include "library_config.hpp"
#include "logging.hpp"
#include "matrix.hpp"
#include "matrix_error.hpp"
#include "qr_decomposition.hpp"
#include "types.hpp"

namespace dotnum {

struct PolynomialDivision;

// Eigenvalues read off the diagonal after plain A <- R*Q iteration
struct CompanionQRResult {
  std::vector<Complex> values;  // real parts only
  bool converged = false;
  int iterations = 0;
};

// Polynomial in one variable with real coefficients, indexed by degree:
// 2x^2 + 6x + 4 is {4, 6, 2}. Trailing zero coefficients are dropped, so the
// last stored coefficient is never zero and the zero polynomial stores none.
class UnivariatePolynomial {
 private:
  std::vector<double> coefficients_;

 public:
  UnivariatePolynomial() = default;

  explicit UnivariatePolynomial(std::vector<double> coefficients)
      : coefficients_(std::move(coefficients)) {
    while (!coefficients_.empty() && coefficients_.back() == 0.0) {
      coefficients_.pop_back();
    }
  }

  UnivariatePolynomial(std::initializer_list<double> coefficients)
      : UnivariatePolynomial(std::vector<double>(coefficients)) {}

  const std::vector<double>& coefficients() const noexcept {
    return coefficients_;
  }

  // Zero for any degree beyond the stored range
  double coefficient(int power) const {
    if (power < 0 || power >= static_cast<int>(coefficients_.size()))
      return 0.0;
    return coefficients_[power];
  }

  // -1 for the zero polynomial
  int degree() const noexcept {
    return static_cast<int>(coefficients_.size()) - 1;
  }

  bool is_zero() const noexcept { return coefficients_.empty(); }

  bool equals(const UnivariatePolynomial& other) const {
    return coefficients_ == other.coefficients_;
  }

  bool operator==(const UnivariatePolynomial& other) const {
    return equals(other);
  }

  // ===== Arithmetic =====

  UnivariatePolynomial plus(const UnivariatePolynomial& other) const {
    const int size = std::max(degree(), other.degree()) + 1;
    std::vector<double> result(size);
    for (int i = 0; i < size; ++i)
      result[i] = coefficient(i) + other.coefficient(i);
    return UnivariatePolynomial(std::move(result));
  }

  UnivariatePolynomial minus(const UnivariatePolynomial& other) const {
    const int size = std::max(degree(), other.degree()) + 1;
    std::vector<double> result(size);
    for (int i = 0; i < size; ++i)
      result[i] = coefficient(i) - other.coefficient(i);
    return UnivariatePolynomial(std::move(result));
  }

  UnivariatePolynomial times(const UnivariatePolynomial& other) const {
    if (is_zero() || other.is_zero())
      return UnivariatePolynomial();
    std::vector<double> result(coefficients_.size() +
                               other.coefficients_.size() - 1);
    for (size_t i = 0; i < coefficients_.size(); ++i)
      for (size_t j = 0; j < other.coefficients_.size(); ++j)
        result[i + j] += coefficients_[i] * other.coefficients_[j];
    return UnivariatePolynomial(std::move(result));
  }

  UnivariatePolynomial operator+(const UnivariatePolynomial& other) const {
    return plus(other);
  }
  UnivariatePolynomial operator-(const UnivariatePolynomial& other) const {
    return minus(other);
  }
  UnivariatePolynomial operator*(const UnivariatePolynomial& other) const {
    return times(other);
  }

  // Long division, this = quotient * divisor + remainder with
  // remainder.degree() < divisor.degree()
  PolynomialDivision divided_by(const UnivariatePolynomial& divisor) const;

  // Euclid's algorithm. Not normalized; use monic() for a canonical form.
  UnivariatePolynomial gcd(const UnivariatePolynomial& other) const;

  // Scaled so the leading coefficient is one. The zero polynomial stays zero.
  UnivariatePolynomial monic() const {
    if (is_zero())
      return *this;
    const double leading = coefficients_.back();
    std::vector<double> result(coefficients_);
    for (double& c : result)
      c /= leading;
    return UnivariatePolynomial(std::move(result));
  }

  // ===== Evaluation =====

  // Horner's method
  double evaluate(double x) const {
    if (is_zero())
      return 0.0;
    double result = coefficients_.back();
    for (int i = degree() - 1; i >= 0; --i) {
      result = result * x + coefficients_[i];
    }
    return result;
  }

  Complex evaluate_complex(const Complex& x) const {
    if (is_zero())
      return Complex::ZERO;
    Complex result = Complex::real_part(coefficients_.back());
    for (int i = degree() - 1; i >= 0; --i) {
      result = result.times(x).plus(Complex::real_part(coefficients_[i]));
    }
    return result;
  }

  // ===== Roots =====

  // Companion matrix: ones on the sub-diagonal, last column -a_i / a_n.
  // Its characteristic polynomial is this polynomial made monic.
  Matrix<double> companion_matrix() const {
    const int n = std::max(degree(), 0);
    Matrix<double> companion(n, n);
    for (int i = 0; i < n; ++i) {
      if (i < n - 1) {
        companion(i + 1, i) = 1.0;
      }
      companion(i, n - 1) = -coefficients_[i] / coefficients_[n];
    }
    return companion;
  }

  // Unshifted QR iteration on the companion matrix. Only converges to a
  // triangular form when the roots have distinct magnitudes, so complex
  // pairs are never resolved.
  CompanionQRResult companion_qr_eigenvalues() const {
    CompanionQRResult result;
    const int n = std::max(degree(), 0);
    Matrix<double> matrix = companion_matrix();

    for (int i = 0; i < kCompanionQRIterations; ++i) {
      QRDecomposition<double> qr(matrix);
      matrix = qr.get_R() * qr.get_Q();
      result.iterations = i + 1;

      if (i % kCompanionQRCheckInterval == 0) {
        double max_lower_triangular = 0.0;
        for (int r = 0; r < n; ++r) {
          for (int c = 0; c < r; ++c) {
            max_lower_triangular =
                std::max(max_lower_triangular, std::abs(matrix(r, c)));
          }
        }
        if (max_lower_triangular < kCompanionQREpsilon) {
          result.converged = true;
          break;
        }
      }
    }

    if (!result.converged) {
      logger()->warn(
          "companion QR iteration did not converge after {} iterations",
          result.iterations);
    }

    result.values.reserve(n);
    for (int i = 0; i < n; ++i)
      result.values.push_back(Complex::real_part(matrix(i, i)));
    return result;
  }

  // All complex roots, repeated roots once per multiplicity. Constant and
  // zero polynomials have no roots.
  std::vector<Complex> roots(
      RootMethod method = RootMethod::EigenDecomposition) const {
    const int deg = degree();
    if (deg <= 0) {
      return {};
    }
    if (deg == 1) {
      return {Complex::real_part(-coefficients_[0] / coefficients_[1])};
    }
    if (coefficients_[0] == 0.0) {
      // x = 0 is a root, once for every factor of x
      size_t zeros = 0;
      while (coefficients_[zeros] == 0.0)
        ++zeros;
      std::vector<Complex> result =
          UnivariatePolynomial(std::vector<double>(
                                   coefficients_.begin() + zeros,
                                   coefficients_.end()))
              .roots(method);
      result.insert(result.end(), zeros, Complex::ZERO);
      return result;
    }
    if (deg == 2) {
      return Complex::solve_quadratic_roots(
                 Complex::real_part(coefficients_[2]),
                 Complex::real_part(coefficients_[1]),
                 Complex::real_part(coefficients_[0]))
          .value();
    }
    if (deg == 3) {
      return Complex::solve_cubic_roots(Complex::real_part(coefficients_[3]),
                                        Complex::real_part(coefficients_[2]),
                                        Complex::real_part(coefficients_[1]),
                                        Complex::real_part(coefficients_[0]))
          .value();
    }

    if (method == RootMethod::UnshiftedQR) {
      logger()->debug("degree {} roots by unshifted companion QR", deg);
      return companion_qr_eigenvalues().values;
    }

    logger()->debug("degree {} roots by companion eigenvalue decomposition",
                    deg);
    const EigenvalueDecomposition decomposition(companion_matrix());
    return decomposition.eigenvalues();
  }

  std::string to_string() const {
    std::ostringstream os;
    os << "UnivariatePolynomial(";
    for (size_t i = 0; i < coefficients_.size(); ++i) {
      if (i > 0)
        os << ", ";
      os << coefficients_[i];
    }
    os << ")";
    return os.str();
  }

  // value * x^power
  static UnivariatePolynomial single_coefficient(double value, int power) {
    std::vector<double> result(std::max(power, 0) + 1);
    result.back() = value;
    return UnivariatePolynomial(std::move(result));
  }

  static const UnivariatePolynomial ZERO;
};

inline const UnivariatePolynomial UnivariatePolynomial::ZERO{};

struct PolynomialDivision {
  UnivariatePolynomial quotient;
  UnivariatePolynomial remainder;
};

inline PolynomialDivision UnivariatePolynomial::divided_by(
    const UnivariatePolynomial& divisor) const {
  if (divisor.is_zero())
    throw divide_by_zero();

  const int d = divisor.degree();
  const int n = degree();
  if (n < d)
    return {UnivariatePolynomial(), *this};

  const double leading = divisor.coefficients_.back();
  std::vector<double> remainder(coefficients_);
  std::vector<double> quotient(n - d + 1);
  for (int k = n; k >= d; --k) {
    const double factor = remainder[k] / leading;
    quotient[k - d] = factor;
    for (int j = 0; j < d; ++j) {
      remainder[k - d + j] -= factor * divisor.coefficients_[j];
    }
    // Cancelled exactly by construction
    remainder[k] = 0.0;
  }
  return {UnivariatePolynomial(std::move(quotient)),
          UnivariatePolynomial(std::move(remainder))};
}

inline UnivariatePolynomial UnivariatePolynomial::gcd(
    const UnivariatePolynomial& other) const {
  UnivariatePolynomial a = *this;
  UnivariatePolynomial b = other;
  while (!b.is_zero()) {
    UnivariatePolynomial t = b;
    b = a.divided_by(b).remainder;
    a = std::move(t);
  }
  return a;
}

inline std::ostream& operator<<(std::ostream& os,
                                const UnivariatePolynomial& p) {
  return os << p.to_string();
}

}  // namespace dotnum

#endif  // DOTNUM_UNIVARIATE_POLYNOMIAL_HPP
