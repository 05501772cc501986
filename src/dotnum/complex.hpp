#ifndef DOTNUM_COMPLEX_HPP
#define DOTNUM_COMPLEX_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace dotnum {

// Complex number a + bi with two parallel operation families: the
// derived-copy forms (plus, times, sqrt_of, ...) leave *this untouched, the
// in-place forms (add, multiply, sqrt, ...) mutate and return *this.
class Complex {
 public:
  double real;
  double imaginary;

  constexpr Complex() : real(0.0), imaginary(0.0) {}
  constexpr Complex(double re, double im) : real(re), imaginary(im) {}

  // ===== Queries =====

  double phase() const { return std::atan2(imaginary, real); }
  double argument() const { return phase(); }

  double magnitude() const { return std::sqrt(magnitude_squared()); }

  constexpr double magnitude_squared() const {
    return real * real + imaginary * imaginary;
  }

  // Exact component-wise equality
  constexpr bool equals(const Complex& other) const {
    return real == other.real && imaginary == other.imaginary;
  }

  // True when no component differs by more than epsilon
  bool equals_epsilon(const Complex& other, double epsilon = 0.0) const {
    return std::max(std::abs(real - other.real),
                    std::abs(imaginary - other.imaginary)) <= epsilon;
  }

  constexpr bool operator==(const Complex& other) const {
    return equals(other);
  }

  // ===== Derived copies =====

  constexpr Complex plus(const Complex& c) const {
    return Complex(real + c.real, imaginary + c.imaginary);
  }

  constexpr Complex minus(const Complex& c) const {
    return Complex(real - c.real, imaginary - c.imaginary);
  }

  constexpr Complex times(const Complex& c) const {
    return Complex(real * c.real - imaginary * c.imaginary,
                   real * c.imaginary + imaginary * c.real);
  }

  constexpr Complex divided_by(const Complex& c) const {
    const double c_mag = c.magnitude_squared();
    return Complex((real * c.real + imaginary * c.imaginary) / c_mag,
                   (imaginary * c.real - real * c.imaginary) / c_mag);
  }

  constexpr Complex negated() const { return Complex(-real, -imaginary); }

  constexpr Complex conjugated() const { return Complex(real, -imaginary); }

  constexpr Complex squared() const { return times(*this); }

  // Principal square root
  Complex sqrt_of() const {
    const double mag = magnitude();
    return Complex(std::sqrt((mag + real) / 2),
                   (imaginary >= 0 ? 1 : -1) * std::sqrt((mag - real) / 2));
  }

  Complex power_by_real(double real_power) const {
    const double mag_times = std::pow(magnitude(), real_power);
    const double angle = real_power * phase();
    return Complex(mag_times * std::cos(angle), mag_times * std::sin(angle));
  }

  Complex sin_of() const {
    return Complex(std::sin(real) * std::cosh(imaginary),
                   std::cos(real) * std::sinh(imaginary));
  }

  Complex cos_of() const {
    return Complex(std::cos(real) * std::cosh(imaginary),
                   -std::sin(real) * std::sinh(imaginary));
  }

  // e^(a+bi) = e^a (cos b + i sin b)
  Complex exponentiated() const {
    return create_polar(std::exp(real), imaginary);
  }

  // ===== In-place forms =====

  Complex& set_real_imaginary(double re, double im) {
    real = re;
    imaginary = im;
    return *this;
  }

  Complex& set_real(double re) {
    real = re;
    return *this;
  }

  Complex& set_imaginary(double im) {
    imaginary = im;
    return *this;
  }

  Complex& set(const Complex& c) {
    return set_real_imaginary(c.real, c.imaginary);
  }

  Complex& set_polar(double mag, double angle) {
    return set_real_imaginary(mag * std::cos(angle), mag * std::sin(angle));
  }

  Complex& add(const Complex& c) {
    return set_real_imaginary(real + c.real, imaginary + c.imaginary);
  }

  Complex& subtract(const Complex& c) {
    return set_real_imaginary(real - c.real, imaginary - c.imaginary);
  }

  Complex& multiply(const Complex& c) {
    return set_real_imaginary(real * c.real - imaginary * c.imaginary,
                              real * c.imaginary + imaginary * c.real);
  }

  Complex& divide(const Complex& c) {
    const double c_mag = c.magnitude_squared();
    return set_real_imaginary(
        (real * c.real + imaginary * c.imaginary) / c_mag,
        (imaginary * c.real - real * c.imaginary) / c_mag);
  }

  Complex& negate() { return set_real_imaginary(-real, -imaginary); }

  Complex& conjugate() { return set_real_imaginary(real, -imaginary); }

  Complex& square() {
    const Complex copy = *this;
    return multiply(copy);
  }

  Complex& sqrt() { return set(sqrt_of()); }

  Complex& sin() { return set(sin_of()); }

  Complex& cos() { return set(cos_of()); }

  Complex& exponentiate() { return set_polar(std::exp(real), imaginary); }

  // ===== Operators =====

  constexpr Complex operator+(const Complex& c) const { return plus(c); }
  constexpr Complex operator-(const Complex& c) const { return minus(c); }
  constexpr Complex operator*(const Complex& c) const { return times(c); }
  constexpr Complex operator/(const Complex& c) const {
    return divided_by(c);
  }
  constexpr Complex operator-() const { return negated(); }

  Complex& operator+=(const Complex& c) { return add(c); }
  Complex& operator-=(const Complex& c) { return subtract(c); }
  Complex& operator*=(const Complex& c) { return multiply(c); }
  Complex& operator/=(const Complex& c) { return divide(c); }

  // The three cube roots, principal root first
  std::array<Complex, 3> cube_roots() const {
    const double arg3 = argument() / 3;
    const Complex really = Complex::real_part(std::cbrt(magnitude()));
    const double third_turn = 2 * std::numbers::pi / 3;

    return {really.times(Complex::imaginary_part(arg3).exponentiated()),
            really.times(
                Complex::imaginary_part(arg3 + third_turn).exponentiated()),
            really.times(
                Complex::imaginary_part(arg3 - third_turn).exponentiated())};
  }

  std::string to_string() const {
    std::ostringstream os;
    os << "Complex(" << real << ", " << imaginary << ")";
    return os.str();
  }

  // ===== Factories =====

  static constexpr Complex real_part(double re) { return Complex(re, 0.0); }

  static constexpr Complex imaginary_part(double im) {
    return Complex(0.0, im);
  }

  static Complex create_polar(double mag, double angle) {
    return Complex(mag * std::cos(angle), mag * std::sin(angle));
  }

  // ===== Closed-form root solvers =====
  // std::nullopt means every value is a root. Repeated roots are returned
  // once per multiplicity.

  // a x + b = 0
  static std::optional<std::vector<Complex>> solve_linear_roots(
      const Complex& a, const Complex& b);

  // a x^2 + b x + c = 0
  static std::optional<std::vector<Complex>> solve_quadratic_roots(
      const Complex& a, const Complex& b, const Complex& c);

  // a x^3 + b x^2 + c x + d = 0
  static std::optional<std::vector<Complex>> solve_cubic_roots(
      const Complex& a, const Complex& b, const Complex& c, const Complex& d);

  static const Complex ZERO;
  static const Complex ONE;
  static const Complex I;
};

inline const Complex Complex::ZERO{0.0, 0.0};
inline const Complex Complex::ONE{1.0, 0.0};
inline const Complex Complex::I{0.0, 1.0};

inline std::ostream& operator<<(std::ostream& os, const Complex& c) {
  return os << c.to_string();
}

inline std::optional<std::vector<Complex>> Complex::solve_linear_roots(
    const Complex& a, const Complex& b) {
  if (a == ZERO) {
    if (b == ZERO)
      return std::nullopt;
    return std::vector<Complex>{};
  }

  return std::vector<Complex>{b.divided_by(a).negate()};
}

inline std::optional<std::vector<Complex>> Complex::solve_quadratic_roots(
    const Complex& a, const Complex& b, const Complex& c) {
  if (a == ZERO) {
    return solve_linear_roots(b, c);
  }

  const Complex denom = Complex::real_part(2).multiply(a);
  const Complex d1 = b.times(b);
  const Complex d2 = Complex::real_part(4).multiply(a).multiply(c);
  const Complex discriminant = Complex(d1).subtract(d2).sqrt();
  return std::vector<Complex>{
      discriminant.minus(b).divide(denom),
      discriminant.negated().subtract(b).divide(denom)};
}

inline std::optional<std::vector<Complex>> Complex::solve_cubic_roots(
    const Complex& a, const Complex& b, const Complex& c, const Complex& d) {
  if (a == ZERO) {
    return solve_quadratic_roots(b, c, d);
  }

  const Complex denom = a.times(real_part(3)).negate();
  const Complex a2 = a.times(a);
  const Complex b2 = b.times(b);
  const Complex b3 = b2.times(b);
  const Complex c2 = c.times(c);
  const Complex c3 = c2.times(c);
  const Complex abc = a.times(b).times(c);

  // Delta0 = b^2 - 3ac, Delta1 = 2b^3 + 27a^2 d - 9abc, kept as separate
  // halves so the degenerate cases can be detected by exact comparison
  const Complex D0_1 = b2;
  const Complex D0_2 = a.times(c).times(real_part(3));
  const Complex D1_1 = b3.times(real_part(2)).add(
      a2.times(d).multiply(real_part(27)));
  const Complex D1_2 = abc.times(real_part(9));

  if (D0_1 == D0_2 && D1_1 == D1_2) {
    const Complex triple_root = b.divided_by(denom);
    return std::vector<Complex>{triple_root, triple_root, triple_root};
  }

  const Complex delta0 = D0_1.minus(D0_2);
  const Complex delta1 = D1_1.minus(D1_2);

  const Complex discriminant1 =
      abc.times(d).multiply(real_part(18)).add(b2.times(c2));
  const Complex discriminant2 =
      b3.times(d)
          .multiply(real_part(4))
          .add(c3.times(a).multiply(real_part(4)))
          .add(a2.times(d).multiply(d).multiply(real_part(27)));

  if (discriminant1 == discriminant2) {
    const Complex simple_root =
        abc.times(real_part(4))
            .subtract(b3.plus(a2.times(d).multiply(real_part(9))))
            .divide(a.times(delta0));
    const Complex double_root =
        a.times(d)
            .multiply(real_part(9))
            .subtract(b.times(c))
            .divide(delta0.times(real_part(2)));
    return std::vector<Complex>{simple_root, double_root, double_root};
  }

  Complex c_cubed;
  if (D0_1 == D0_2) {
    c_cubed = delta1;
  } else {
    c_cubed = delta1
                  .plus(delta1.times(delta1)
                            .subtract(delta0.times(delta0)
                                          .multiply(delta0)
                                          .multiply(real_part(4)))
                            .sqrt())
                  .divide(real_part(2));
  }

  std::vector<Complex> roots;
  roots.reserve(3);
  for (const Complex& root : c_cubed.cube_roots()) {
    roots.push_back(b.plus(root).add(delta0.divided_by(root)).divide(denom));
  }
  return roots;
}

}  // namespace dotnum

#endif  // DOTNUM_COMPLEX_HPP
