#ifndef DOTNUM_LU_DECOMPOSITION_DECIMAL_HPP
#define DOTNUM_LU_DECOMPOSITION_DECIMAL_HPP

#include <boost/multiprecision/cpp_dec_float.hpp>
#include "lu_decomposition.hpp"

namespace dotnum {

// 50 significant decimal digits
using Decimal = boost::multiprecision::cpp_dec_float_50;

// LU on decimal entries. Accepts Matrix<double> (entries are converted) or
// Matrix<Decimal>; solve() takes a Matrix<Decimal> right-hand side.
using LUDecompositionDecimal = LUDecomposition<Decimal>;

using DecimalMatrix = Matrix<Decimal>;

}  // namespace dotnum

#endif  // DOTNUM_LU_DECOMPOSITION_DECIMAL_HPP
