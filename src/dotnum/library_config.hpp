#ifndef DOTNUM_LIBRARY_CONFIG_HPP
#define DOTNUM_LIBRARY_CONFIG_HPP

#include <cstddef>
#include <limits>

namespace dotnum {

static constexpr bool DOTNUM_OPENMP_ENABLED = true;
static constexpr size_t ThreadCount = 2;
static constexpr size_t BLOCK_SIZE = 64;

// Below this many entries the OpenMP kernels are not worth the fork/join
static constexpr size_t OPENMP_MIN_ENTRIES = 4096;

// ===== Numerical tuning =====
// These values come from the EISPACK/Jama procedures and are tuned together.
static constexpr double kEpsilon = std::numeric_limits<double>::epsilon();  // 2^-52
static constexpr int kExceptionalShiftIteration = 10;
static constexpr int kSecondExceptionalShiftIteration = 30;

// Caps that guarantee termination of the iterative reductions
static constexpr int kMaxQLIterationsPerEigenvalue = 100;
static constexpr int kMaxSchurIterationsPerEigenvalue = 100;

// Unshifted QR iteration on companion matrices
static constexpr int kCompanionQRIterations = 500;
static constexpr int kCompanionQRCheckInterval = 10;
static constexpr double kCompanionQREpsilon = 1e-13;

}  // namespace dotnum

#endif  // DOTNUM_LIBRARY_CONFIG_HPP
