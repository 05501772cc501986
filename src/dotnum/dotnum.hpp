#ifndef DOTNUM_HPP
#define DOTNUM_HPP

#include "complex.hpp"
#include "eigenvalue_decomposition.hpp"
#include "library_config.hpp"
#include "linear_solve.hpp"
#include "logging.hpp"
#include "lu_decomposition.hpp"
#include "lu_decomposition_decimal.hpp"
#include "matrix.hpp"
#include "matrix_error.hpp"
#include "qr_decomposition.hpp"
#include "types.hpp"
#include "univariate_polynomial.hpp"

#endif  // DOTNUM_HPP
