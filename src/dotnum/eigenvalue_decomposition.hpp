#ifndef DOTNUM_EIGENVALUE_DECOMPOSITION_HPP
#define DOTNUM_EIGENVALUE_DECOMPOSITION_HPP

#include <algorithm>
#include <cmath>
#include <vector>
#include "complex.hpp"
#include "library_config.hpp"
#include "logging.hpp"
#include "matrix.hpp"
#include "matrix_error.hpp"
#include "types.hpp"

namespace dotnum {

// Eigenvalues and eigenvectors of a real square matrix, after Jama.
//
// If A is symmetric, A = V * D * V' with D diagonal and V orthogonal.
// Eigenvalues come out in ascending order.
//
// Otherwise D is block diagonal with real eigenvalues in 1-by-1 blocks and
// complex pairs lambda +/- i*mu in 2-by-2 blocks [lambda, mu; -mu, lambda],
// and A * V = V * D. V may be badly conditioned or even singular.
//
// The reductions are iteration capped. Hitting a cap leaves the current best
// approximation in place and clears converged(); no exception is thrown.
// Input with NaN or infinite entries also clears converged().
class EigenvalueDecomposition {
 private:
  int n_;
  EigenPath path_;
  std::vector<double> d_;  // real parts
  std::vector<double> e_;  // imaginary parts
  Matrix<double> V_;
  Matrix<double> H_;        // nonsymmetric Hessenberg form
  std::vector<double> ort_; // nonsymmetric workspace
  bool converged_ = true;
  int iterations_ = 0;

  // Symmetric Householder reduction to tridiagonal form.
  void tred2() {
    const int n = n_;
    auto& V = V_;
    auto& d = d_;
    auto& e = e_;

    for (int j = 0; j < n; ++j) {
      d[j] = V(n - 1, j);
    }

    // Householder reduction to tridiagonal form.
    for (int i = n - 1; i > 0; --i) {
      // Scale to avoid under/overflow.
      double scale = 0.0;
      double h = 0.0;
      for (int k = 0; k < i; ++k) {
        scale += std::abs(d[k]);
      }
      if (scale == 0.0) {
        e[i] = d[i - 1];
        for (int j = 0; j < i; ++j) {
          d[j] = V(i - 1, j);
          V(i, j) = 0.0;
          V(j, i) = 0.0;
        }
      } else {
        // Generate Householder vector.
        for (int k = 0; k < i; ++k) {
          d[k] /= scale;
          h += d[k] * d[k];
        }
        double f = d[i - 1];
        double g = std::sqrt(h);
        if (f > 0) {
          g = -g;
        }
        e[i] = scale * g;
        h = h - f * g;
        d[i - 1] = f - g;
        for (int j = 0; j < i; ++j) {
          e[j] = 0.0;
        }

        // Apply similarity transformation to remaining columns.
        for (int j = 0; j < i; ++j) {
          f = d[j];
          V(j, i) = f;
          g = e[j] + V(j, j) * f;
          for (int k = j + 1; k <= i - 1; ++k) {
            g += V(k, j) * d[k];
            e[k] += V(k, j) * f;
          }
          e[j] = g;
        }
        f = 0.0;
        for (int j = 0; j < i; ++j) {
          e[j] /= h;
          f += e[j] * d[j];
        }
        const double hh = f / (h + h);
        for (int j = 0; j < i; ++j) {
          e[j] -= hh * d[j];
        }
        for (int j = 0; j < i; ++j) {
          f = d[j];
          g = e[j];
          for (int k = j; k <= i - 1; ++k) {
            V(k, j) -= (f * e[k] + g * d[k]);
          }
          d[j] = V(i - 1, j);
          V(i, j) = 0.0;
        }
      }
      d[i] = h;
    }

    // Accumulate transformations.
    for (int i = 0; i < n - 1; ++i) {
      V(n - 1, i) = V(i, i);
      V(i, i) = 1.0;
      const double h = d[i + 1];
      if (h != 0.0) {
        for (int k = 0; k <= i; ++k) {
          d[k] = V(k, i + 1) / h;
        }
        for (int j = 0; j <= i; ++j) {
          double g = 0.0;
          for (int k = 0; k <= i; ++k) {
            g += V(k, i + 1) * V(k, j);
          }
          for (int k = 0; k <= i; ++k) {
            V(k, j) -= g * d[k];
          }
        }
      }
      for (int k = 0; k <= i; ++k) {
        V(k, i + 1) = 0.0;
      }
    }
    for (int j = 0; j < n; ++j) {
      d[j] = V(n - 1, j);
      V(n - 1, j) = 0.0;
    }
    V(n - 1, n - 1) = 1.0;
    e[0] = 0.0;
  }

  // Symmetric tridiagonal QL algorithm.
  void tql2() {
    const int n = n_;
    auto& V = V_;
    auto& d = d_;
    auto& e = e_;

    for (int i = 1; i < n; ++i) {
      e[i - 1] = e[i];
    }
    e[n - 1] = 0.0;

    double f = 0.0;
    double tst1 = 0.0;
    const double eps = kEpsilon;
    for (int l = 0; l < n; ++l) {
      // Find small subdiagonal element
      tst1 = std::max(tst1, std::abs(d[l]) + std::abs(e[l]));
      int m = l;
      while (m < n) {
        if (std::abs(e[m]) <= eps * tst1) {
          break;
        }
        ++m;
      }
      // A NaN tolerance never passes the test above
      if (m == n) {
        m = n - 1;
      }

      // If m == l, d[l] is an eigenvalue,
      // otherwise, iterate.
      if (m > l) {
        int iter = 0;
        do {
          if (iter == kMaxQLIterationsPerEigenvalue) {
            converged_ = false;
            logger()->warn(
                "tql2: eigenvalue {} not converged after {} iterations", l,
                iter);
            break;
          }
          ++iter;
          ++iterations_;

          // Compute implicit shift
          double g = d[l];
          double p = (d[l + 1] - g) / (2.0 * e[l]);
          double r = Matrix<double>::hypot(p, 1.0);
          if (p < 0) {
            r = -r;
          }
          d[l] = e[l] / (p + r);
          d[l + 1] = e[l] * (p + r);
          const double dl1 = d[l + 1];
          double h = g - d[l];
          for (int i = l + 2; i < n; ++i) {
            d[i] -= h;
          }
          f = f + h;

          // Implicit QL transformation.
          p = d[m];
          double c = 1.0;
          double c2 = c;
          double c3 = c;
          const double el1 = e[l + 1];
          double s = 0.0;
          double s2 = 0.0;
          for (int i = m - 1; i >= l; --i) {
            c3 = c2;
            c2 = c;
            s2 = s;
            g = c * e[i];
            h = c * p;
            r = Matrix<double>::hypot(p, e[i]);
            e[i + 1] = s * r;
            s = e[i] / r;
            c = p / r;
            p = c * d[i] - s * g;
            d[i + 1] = h + s * (c * g + s * d[i]);

            // Accumulate transformation.
            for (int k = 0; k < n; ++k) {
              h = V(k, i + 1);
              V(k, i + 1) = s * V(k, i) + c * h;
              V(k, i) = c * V(k, i) - s * h;
            }
          }
          p = -s * s2 * c3 * el1 * e[l] / dl1;
          e[l] = s * p;
          d[l] = c * p;

          // Check for convergence.
        } while (std::abs(e[l]) > eps * tst1);
      }
      d[l] = d[l] + f;
      e[l] = 0.0;
    }

    // Sort eigenvalues and corresponding vectors.
    for (int i = 0; i < n - 1; ++i) {
      int k = i;
      double p = d[i];
      for (int j = i + 1; j < n; ++j) {
        if (d[j] < p) {
          k = j;
          p = d[j];
        }
      }
      if (k != i) {
        d[k] = d[i];
        d[i] = p;
        for (int j = 0; j < n; ++j) {
          std::swap(V(j, i), V(j, k));
        }
      }
    }
  }

  // Nonsymmetric reduction to Hessenberg form.
  void orthes() {
    const int n = n_;
    auto& H = H_;
    auto& V = V_;
    auto& ort = ort_;
    const int low = 0;
    const int high = n - 1;

    for (int m = low + 1; m <= high - 1; ++m) {
      // Scale column.
      double scale = 0.0;
      for (int i = m; i <= high; ++i) {
        scale += std::abs(H(i, m - 1));
      }
      if (scale != 0.0) {
        // Compute Householder transformation.
        double h = 0.0;
        for (int i = high; i >= m; --i) {
          ort[i] = H(i, m - 1) / scale;
          h += ort[i] * ort[i];
        }
        double g = std::sqrt(h);
        if (ort[m] > 0) {
          g = -g;
        }
        h = h - ort[m] * g;
        ort[m] = ort[m] - g;

        // Apply Householder similarity transformation
        // H = (I-u*u'/h)*H*(I-u*u')/h)
        for (int j = m; j < n; ++j) {
          double f = 0.0;
          for (int i = high; i >= m; --i) {
            f += ort[i] * H(i, j);
          }
          f = f / h;
          for (int i = m; i <= high; ++i) {
            H(i, j) -= f * ort[i];
          }
        }

        for (int i = 0; i <= high; ++i) {
          double f = 0.0;
          for (int j = high; j >= m; --j) {
            f += ort[j] * H(i, j);
          }
          f = f / h;
          for (int j = m; j <= high; ++j) {
            H(i, j) -= f * ort[j];
          }
        }
        ort[m] = scale * ort[m];
        H(m, m - 1) = scale * g;
      }
    }

    // Accumulate transformations (Algorithm proc orttrans).
    for (int i = 0; i < n; ++i) {
      for (int j = 0; j < n; ++j) {
        V(i, j) = (i == j ? 1.0 : 0.0);
      }
    }

    for (int m = high - 1; m >= low + 1; --m) {
      if (H(m, m - 1) != 0.0) {
        for (int i = m + 1; i <= high; ++i) {
          ort[i] = H(i, m - 1);
        }
        for (int j = m; j <= high; ++j) {
          double g = 0.0;
          for (int i = m; i <= high; ++i) {
            g += ort[i] * V(i, j);
          }
          // Double division avoids possible underflow
          g = (g / ort[m]) / H(m, m - 1);
          for (int i = m; i <= high; ++i) {
            V(i, j) += g * ort[i];
          }
        }
      }
    }
  }

  // Complex scalar division (xr + i xi) / (yr + i yi).
  static Complex cdiv(double xr, double xi, double yr, double yi) {
    double r;
    double d;
    if (std::abs(yr) > std::abs(yi)) {
      r = yi / yr;
      d = yr + r * yi;
      return Complex((xr + r * xi) / d, (xi - r * xr) / d);
    }
    r = yr / yi;
    d = yi + r * yr;
    return Complex((r * xr + xi) / d, (r * xi - xr) / d);
  }

  // Nonsymmetric reduction from Hessenberg to real Schur form.
  void hqr2() {
    // This is derived from the Algol procedure hqr2,
    // by Martin and Wilkinson, Handbook for Auto. Comp.,
    // Vol.ii-Linear Algebra, and the corresponding
    // Fortran subroutine in EISPACK.

    // Initialize
    const int nn = n_;
    int n = nn - 1;
    const int low = 0;
    const int high = nn - 1;
    const double eps = kEpsilon;
    auto& H = H_;
    auto& V = V_;
    auto& d = d_;
    auto& e = e_;
    double exshift = 0.0;
    double p = 0, q = 0, r = 0, s = 0, z = 0, t, w, x, y;

    // Store roots isolated by balanc and compute matrix norm
    double norm = 0.0;
    for (int i = 0; i < nn; ++i) {
      if (i < low || i > high) {
        d[i] = H(i, i);
        e[i] = 0.0;
      }
      for (int j = std::max(i - 1, 0); j < nn; ++j) {
        norm += std::abs(H(i, j));
      }
    }

    // Outer loop over eigenvalue index
    const int max_iterations = kMaxSchurIterationsPerEigenvalue * nn;
    int total = 0;
    int iter = 0;
    while (n >= low) {
      // Look for single small sub-diagonal element
      int l = n;
      while (l > low) {
        s = std::abs(H(l - 1, l - 1)) + std::abs(H(l, l));
        if (s == 0.0) {
          s = norm;
        }
        if (std::abs(H(l, l - 1)) < eps * s) {
          break;
        }
        --l;
      }

      // Check for convergence
      if (l == n) {
        // One root found
        H(n, n) = H(n, n) + exshift;
        d[n] = H(n, n);
        e[n] = 0.0;
        logger()->trace("hqr2: real root {} at index {} after {} iterations",
                        d[n], n, iter);
        --n;
        iter = 0;
      } else if (l == n - 1) {
        // Two roots found
        w = H(n, n - 1) * H(n - 1, n);
        p = (H(n - 1, n - 1) - H(n, n)) / 2.0;
        q = p * p + w;
        z = std::sqrt(std::abs(q));
        H(n, n) = H(n, n) + exshift;
        H(n - 1, n - 1) = H(n - 1, n - 1) + exshift;
        x = H(n, n);

        if (q >= 0) {
          // Real pair
          if (p >= 0) {
            z = p + z;
          } else {
            z = p - z;
          }
          d[n - 1] = x + z;
          d[n] = d[n - 1];
          if (z != 0.0) {
            d[n] = x - w / z;
          }
          e[n - 1] = 0.0;
          e[n] = 0.0;
          x = H(n, n - 1);
          s = std::abs(x) + std::abs(z);
          p = x / s;
          q = z / s;
          r = std::sqrt(p * p + q * q);
          p = p / r;
          q = q / r;

          // Row modification
          for (int j = n - 1; j < nn; ++j) {
            z = H(n - 1, j);
            H(n - 1, j) = q * z + p * H(n, j);
            H(n, j) = q * H(n, j) - p * z;
          }

          // Column modification
          for (int i = 0; i <= n; ++i) {
            z = H(i, n - 1);
            H(i, n - 1) = q * z + p * H(i, n);
            H(i, n) = q * H(i, n) - p * z;
          }

          // Accumulate transformations
          for (int i = low; i <= high; ++i) {
            z = V(i, n - 1);
            V(i, n - 1) = q * z + p * V(i, n);
            V(i, n) = q * V(i, n) - p * z;
          }
        } else {
          // Complex pair
          d[n - 1] = x + p;
          d[n] = x + p;
          e[n - 1] = z;
          e[n] = -z;
        }
        logger()->trace("hqr2: root pair at indices {},{} after {} iterations",
                        n - 1, n, iter);
        n = n - 2;
        iter = 0;
      } else {
        // No convergence yet
        if (total >= max_iterations) {
          converged_ = false;
          logger()->warn(
              "hqr2: {} eigenvalues not converged after {} iterations",
              n - low + 1, total);
          // Keep the current diagonal as real approximations
          for (int i = low; i <= n; ++i) {
            H(i, i) = H(i, i) + exshift;
            d[i] = H(i, i);
            e[i] = 0.0;
          }
          break;
        }

        // Form shift
        x = H(n, n);
        y = 0.0;
        w = 0.0;
        if (l < n) {
          y = H(n - 1, n - 1);
          w = H(n, n - 1) * H(n - 1, n);
        }

        // Wilkinson's original ad hoc shift
        if (iter == kExceptionalShiftIteration) {
          exshift += x;
          for (int i = low; i <= n; ++i) {
            H(i, i) -= x;
          }
          s = std::abs(H(n, n - 1)) + std::abs(H(n - 1, n - 2));
          x = y = 0.75 * s;
          w = -0.4375 * s * s;
        }

        // MATLAB's new ad hoc shift
        if (iter == kSecondExceptionalShiftIteration) {
          s = (y - x) / 2.0;
          s = s * s + w;
          if (s > 0) {
            s = std::sqrt(s);
            if (y < x) {
              s = -s;
            }
            s = x - w / ((y - x) / 2.0 + s);
            for (int i = low; i <= n; ++i) {
              H(i, i) -= s;
            }
            exshift += s;
            x = y = w = 0.964;
          }
        }

        ++iter;
        ++total;
        ++iterations_;

        // Look for two consecutive small sub-diagonal elements
        int m = n - 2;
        while (m >= l) {
          z = H(m, m);
          r = x - z;
          s = y - z;
          p = (r * s - w) / H(m + 1, m) + H(m, m + 1);
          q = H(m + 1, m + 1) - z - r - s;
          r = H(m + 2, m + 1);
          s = std::abs(p) + std::abs(q) + std::abs(r);
          p = p / s;
          q = q / s;
          r = r / s;
          if (m == l) {
            break;
          }
          if (std::abs(H(m, m - 1)) * (std::abs(q) + std::abs(r)) <
              eps * (std::abs(p) * (std::abs(H(m - 1, m - 1)) + std::abs(z) +
                                    std::abs(H(m + 1, m + 1))))) {
            break;
          }
          --m;
        }

        for (int i = m + 2; i <= n; ++i) {
          H(i, i - 2) = 0.0;
          if (i > m + 2) {
            H(i, i - 3) = 0.0;
          }
        }

        // Double QR step involving rows l:n and columns m:n
        for (int k = m; k <= n - 1; ++k) {
          const bool notlast = (k != n - 1);
          if (k != m) {
            p = H(k, k - 1);
            q = H(k + 1, k - 1);
            r = (notlast ? H(k + 2, k - 1) : 0.0);
            x = std::abs(p) + std::abs(q) + std::abs(r);
            if (x == 0.0) {
              continue;
            }
            p = p / x;
            q = q / x;
            r = r / x;
          }

          s = std::sqrt(p * p + q * q + r * r);
          if (p < 0) {
            s = -s;
          }
          if (s != 0) {
            if (k != m) {
              H(k, k - 1) = -s * x;
            } else if (l != m) {
              H(k, k - 1) = -H(k, k - 1);
            }
            p = p + s;
            x = p / s;
            y = q / s;
            z = r / s;
            q = q / p;
            r = r / p;

            // Row modification
            for (int j = k; j < nn; ++j) {
              p = H(k, j) + q * H(k + 1, j);
              if (notlast) {
                p = p + r * H(k + 2, j);
                H(k + 2, j) = H(k + 2, j) - p * z;
              }
              H(k, j) = H(k, j) - p * x;
              H(k + 1, j) = H(k + 1, j) - p * y;
            }

            // Column modification
            for (int i = 0; i <= std::min(n, k + 3); ++i) {
              p = x * H(i, k) + y * H(i, k + 1);
              if (notlast) {
                p = p + z * H(i, k + 2);
                H(i, k + 2) = H(i, k + 2) - p * r;
              }
              H(i, k) = H(i, k) - p;
              H(i, k + 1) = H(i, k + 1) - p * q;
            }

            // Accumulate transformations
            for (int i = low; i <= high; ++i) {
              p = x * V(i, k) + y * V(i, k + 1);
              if (notlast) {
                p = p + z * V(i, k + 2);
                V(i, k + 2) = V(i, k + 2) - p * r;
              }
              V(i, k) = V(i, k) - p;
              V(i, k + 1) = V(i, k + 1) - p * q;
            }
          }  // (s != 0)
        }  // k loop
      }  // check convergence
    }  // while (n >= low)

    // Backsubstitute to find vectors of upper triangular form
    if (norm == 0.0) {
      return;
    }

    for (n = nn - 1; n >= 0; --n) {
      p = d[n];
      q = e[n];

      if (q == 0) {
        // Real vector
        int l = n;
        H(n, n) = 1.0;
        for (int i = n - 1; i >= 0; --i) {
          w = H(i, i) - p;
          r = 0.0;
          for (int j = l; j <= n; ++j) {
            r = r + H(i, j) * H(j, n);
          }
          if (e[i] < 0.0) {
            z = w;
            s = r;
          } else {
            l = i;
            if (e[i] == 0.0) {
              if (w != 0.0) {
                H(i, n) = -r / w;
              } else {
                H(i, n) = -r / (eps * norm);
              }
            } else {
              // Solve real equations
              x = H(i, i + 1);
              y = H(i + 1, i);
              q = (d[i] - p) * (d[i] - p) + e[i] * e[i];
              t = (x * s - z * r) / q;
              H(i, n) = t;
              if (std::abs(x) > std::abs(z)) {
                H(i + 1, n) = (-r - w * t) / x;
              } else {
                H(i + 1, n) = (-s - y * t) / z;
              }
            }

            // Overflow control
            t = std::abs(H(i, n));
            if ((eps * t) * t > 1) {
              for (int j = i; j <= n; ++j) {
                H(j, n) = H(j, n) / t;
              }
            }
          }
        }
      } else if (q < 0) {
        // Complex vector
        int l = n - 1;

        // Last vector component imaginary so matrix is triangular
        if (std::abs(H(n, n - 1)) > std::abs(H(n - 1, n))) {
          H(n - 1, n - 1) = q / H(n, n - 1);
          H(n - 1, n) = -(H(n, n) - p) / H(n, n - 1);
        } else {
          const Complex c = cdiv(0.0, -H(n - 1, n), H(n - 1, n - 1) - p, q);
          H(n - 1, n - 1) = c.real;
          H(n - 1, n) = c.imaginary;
        }
        H(n, n - 1) = 0.0;
        H(n, n) = 1.0;
        for (int i = n - 2; i >= 0; --i) {
          double ra = 0.0;
          double sa = 0.0;
          for (int j = l; j <= n; ++j) {
            ra = ra + H(i, j) * H(j, n - 1);
            sa = sa + H(i, j) * H(j, n);
          }
          w = H(i, i) - p;

          if (e[i] < 0.0) {
            z = w;
            r = ra;
            s = sa;
          } else {
            l = i;
            if (e[i] == 0) {
              const Complex c = cdiv(-ra, -sa, w, q);
              H(i, n - 1) = c.real;
              H(i, n) = c.imaginary;
            } else {
              // Solve complex equations
              x = H(i, i + 1);
              y = H(i + 1, i);
              double vr = (d[i] - p) * (d[i] - p) + e[i] * e[i] - q * q;
              const double vi = (d[i] - p) * 2.0 * q;
              if (vr == 0.0 && vi == 0.0) {
                vr = eps * norm *
                     (std::abs(w) + std::abs(q) + std::abs(x) + std::abs(y) +
                      std::abs(z));
              }
              const Complex c = cdiv(x * r - z * ra + q * sa,
                                     x * s - z * sa - q * ra, vr, vi);
              H(i, n - 1) = c.real;
              H(i, n) = c.imaginary;
              if (std::abs(x) > (std::abs(z) + std::abs(q))) {
                H(i + 1, n - 1) = (-ra - w * H(i, n - 1) + q * H(i, n)) / x;
                H(i + 1, n) = (-sa - w * H(i, n) - q * H(i, n - 1)) / x;
              } else {
                const Complex c2 =
                    cdiv(-r - y * H(i, n - 1), -s - y * H(i, n), z, q);
                H(i + 1, n - 1) = c2.real;
                H(i + 1, n) = c2.imaginary;
              }
            }

            // Overflow control
            t = std::max(std::abs(H(i, n - 1)), std::abs(H(i, n)));
            if ((eps * t) * t > 1) {
              for (int j = i; j <= n; ++j) {
                H(j, n - 1) = H(j, n - 1) / t;
                H(j, n) = H(j, n) / t;
              }
            }
          }
        }
      }
    }

    // Vectors of isolated roots
    for (int i = 0; i < nn; ++i) {
      if (i < low || i > high) {
        for (int j = i; j < nn; ++j) {
          V(i, j) = H(i, j);
        }
      }
    }

    // Back transformation to get eigenvectors of original matrix
    for (int j = nn - 1; j >= low; --j) {
      for (int i = low; i <= high; ++i) {
        z = 0.0;
        for (int k = low; k <= std::min(j, high); ++k) {
          z = z + V(i, k) * H(k, j);
        }
        V(i, j) = z;
      }
    }
  }

 public:
  explicit EigenvalueDecomposition(const Matrix<double>& matrix)
      : n_(static_cast<int>(matrix.cols())),
        path_(EigenPath::Nonsymmetric),
        d_(matrix.cols()),
        e_(matrix.cols()),
        V_(matrix.cols(), matrix.cols()) {
    if (!matrix.is_square())
      throw not_square();

    if (n_ == 0) {
      path_ = EigenPath::Symmetric;
      return;
    }

    const bool finite =
        std::all_of(matrix.data(), matrix.data() + matrix.size(),
                    [](double value) { return std::isfinite(value); });

    if (matrix.is_symmetric()) {
      path_ = EigenPath::Symmetric;
      V_ = matrix;

      // Tridiagonalize.
      tred2();

      // Diagonalize.
      tql2();
    } else {
      H_ = matrix;
      ort_.assign(matrix.cols(), 0.0);

      // Reduce to Hessenberg form.
      orthes();

      // Reduce Hessenberg to real Schur form.
      hqr2();
    }

    // NaN or infinite entries
    if (!finite) {
      converged_ = false;
      logger()->warn("eigenvalue decomposition of {}x{} matrix with "
                     "non-finite entries",
                     n_, n_);
    }

    logger()->debug("eigenvalue decomposition of {}x{} matrix: {} path, {} "
                    "iterations{}",
                    n_, n_,
                    path_ == EigenPath::Symmetric ? "symmetric"
                                                  : "nonsymmetric",
                    iterations_, converged_ ? "" : " (not converged)");
  }

  EigenPath path() const noexcept { return path_; }
  bool converged() const noexcept { return converged_; }
  int iterations() const noexcept { return iterations_; }

  // Eigenvector matrix, columns are the (real, or real/imaginary pairs of)
  // eigenvectors
  Matrix<double> get_V() const { return V_; }

  const std::vector<double>& real_eigenvalues() const { return d_; }
  const std::vector<double>& imag_eigenvalues() const { return e_; }

  std::vector<Complex> eigenvalues() const {
    std::vector<Complex> result;
    result.reserve(d_.size());
    for (size_t i = 0; i < d_.size(); ++i)
      result.emplace_back(d_[i], e_[i]);
    return result;
  }

  // Block diagonal eigenvalue matrix
  Matrix<double> get_D() const {
    const size_t n = d_.size();
    Matrix<double> D(n, n);
    for (size_t i = 0; i < n; ++i) {
      D(i, i) = d_[i];
      if (e_[i] > 0) {
        D(i, i + 1) = e_[i];
      } else if (e_[i] < 0) {
        D(i, i - 1) = e_[i];
      }
    }
    return D;
  }
};

}  // namespace dotnum

#endif  // DOTNUM_EIGENVALUE_DECOMPOSITION_HPP
