#include "dotnum/lu_decomposition.hpp"
#include <gtest/gtest.h>
#include <type_traits>
#include "dotnum/lu_decomposition_decimal.hpp"
#include "dotnum/matrix_error.hpp"
#include "test_utils.hpp"

using dotnum::Decimal;
using dotnum::DecimalMatrix;
using dotnum::LUDecomposition;
using dotnum::LUDecompositionDecimal;

class LUDecompositionTest : public ::testing::Test {
 protected:
  Matrix A = {{2.0, 1.0, 1.0}, {4.0, -6.0, 0.0}, {-2.0, 7.0, 2.0}};
  Matrix b = {{5.0}, {-2.0}, {9.0}};

  static Matrix hilbert(size_t n) {
    Matrix h(n, n);
    for (size_t i = 0; i < n; ++i)
      for (size_t j = 0; j < n; ++j)
        h(i, j) = 1.0 / double(i + j + 1);
    return h;
  }
};

TEST_F(LUDecompositionTest, DeducesElementType) {
  LUDecomposition lu(A);
  static_assert(std::is_same_v<decltype(lu), LUDecomposition<double>>);
  EXPECT_EQ(lu.rows(), size_t(3));
  EXPECT_EQ(lu.cols(), size_t(3));
}

TEST_F(LUDecompositionTest, SolvesSquareSystem) {
  LUDecomposition lu(A);
  ASSERT_TRUE(lu.is_nonsingular());

  Matrix x = lu.solve(b);
  assert_matrix_near(x, Matrix{{1.0}, {1.0}, {2.0}}, 1e-12);
  assert_matrix_near(A * x, b, 1e-12);
}

TEST_F(LUDecompositionTest, SolvesMultipleRightHandSides) {
  LUDecomposition lu(A);
  Matrix B = {{5.0, 2.0}, {-2.0, 4.0}, {9.0, -2.0}};
  Matrix X = lu.solve(B);
  assert_matrix_near(A * X, B, 1e-12);
}

TEST_F(LUDecompositionTest, FactorsReproducePermutedInput) {
  LUDecomposition lu(A);
  Matrix L = lu.get_L();
  Matrix U = lu.get_U();

  for (size_t i = 0; i < 3; ++i) {
    EXPECT_DOUBLE_EQ(L(i, i), 1.0);
    for (size_t j = i + 1; j < 3; ++j) {
      EXPECT_DOUBLE_EQ(L(i, j), 0.0);
      EXPECT_DOUBLE_EQ(U(j, i), 0.0);
    }
  }

  Matrix permuted = A.get_array_row_matrix(lu.pivot(), 0, 2);
  assert_matrix_near(L * U, permuted, 1e-12);

  // Partial pivoting picks the largest entry of the first column
  EXPECT_EQ(lu.pivot()[0], size_t(1));
  const std::vector<double> double_pivot = lu.double_pivot();
  ASSERT_EQ(double_pivot.size(), size_t(3));
  for (size_t i = 0; i < 3; ++i)
    EXPECT_DOUBLE_EQ(double_pivot[i], double(lu.pivot()[i]));
}

TEST_F(LUDecompositionTest, Determinant) {
  EXPECT_NEAR(LUDecomposition(A).det(), -16.0, 1e-12);

  Matrix swap = {{0.0, 1.0}, {1.0, 0.0}};
  LUDecomposition lu(swap);
  EXPECT_EQ(lu.pivot_sign(), -1);
  EXPECT_DOUBLE_EQ(lu.det(), -1.0);

  Matrix tall = {{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}};
  EXPECT_THROW(LUDecomposition(tall).det(), dotnum::not_square);
}

TEST_F(LUDecompositionTest, SingularMatrix) {
  Matrix singular = {{1.0, 2.0}, {2.0, 4.0}};
  LUDecomposition lu(singular);
  EXPECT_FALSE(lu.is_nonsingular());
  EXPECT_DOUBLE_EQ(lu.det(), 0.0);
  EXPECT_THROW(lu.solve(Matrix{{1.0}, {2.0}}), dotnum::singular_matrix);
}

TEST_F(LUDecompositionTest, ShapeIsCheckedBeforeSingularity) {
  Matrix singular = {{1.0, 2.0}, {2.0, 4.0}};
  LUDecomposition lu(singular);
  EXPECT_THROW(lu.solve(Matrix{{1.0}, {2.0}, {3.0}}),
               dotnum::dimension_mismatch);

  LUDecomposition regular(A);
  EXPECT_THROW(regular.solve(Matrix{{1.0}, {2.0}}), dotnum::dimension_mismatch);
}

TEST_F(LUDecompositionTest, OneByOne) {
  LUDecomposition lu(Matrix{{5.0}});
  EXPECT_TRUE(lu.is_nonsingular());
  EXPECT_DOUBLE_EQ(lu.det(), 5.0);
  assert_matrix_near(lu.solve(Matrix{{10.0}}), Matrix{{2.0}});
}

TEST_F(LUDecompositionTest, AllZeroMatrix) {
  LUDecomposition lu(Matrix(size_t(3), size_t(3)));
  EXPECT_FALSE(lu.is_nonsingular());
  EXPECT_DOUBLE_EQ(lu.det(), 0.0);
  EXPECT_THROW(lu.solve(Matrix(size_t(3), size_t(1))), dotnum::singular_matrix);
}

TEST_F(LUDecompositionTest, TallMatrixFactors) {
  Matrix tall = {{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}};
  LUDecomposition lu(tall);
  Matrix L = lu.get_L();
  Matrix U = lu.get_U();
  EXPECT_EQ(L.rows(), size_t(3));
  EXPECT_EQ(L.cols(), size_t(2));
  EXPECT_EQ(U.rows(), size_t(2));
  EXPECT_EQ(U.cols(), size_t(2));
  assert_matrix_near(L * U, tall.get_array_row_matrix(lu.pivot(), 0, 1),
                     1e-12);
  EXPECT_FALSE(lu.is_nonsingular());
}

TEST_F(LUDecompositionTest, DecompositionKeepsItsOwnCopy) {
  Matrix source = A;
  LUDecomposition lu(source);
  source(0, 0) = 1000.0;
  assert_matrix_near(lu.solve(b), Matrix{{1.0}, {1.0}, {2.0}}, 1e-12);
}

// ===== Decimal variant =====

TEST_F(LUDecompositionTest, DecimalAgreesWithDouble) {
  LUDecompositionDecimal decimal(A);
  LUDecomposition<double> binary(A);

  EXPECT_NEAR(decimal.det().convert_to<double>(), binary.det(), 1e-12);
  EXPECT_EQ(decimal.pivot(), binary.pivot());

  DecimalMatrix x = decimal.solve(DecimalMatrix(b));
  Matrix expected = binary.solve(b);
  ASSERT_EQ(x.rows(), size_t(3));
  for (size_t i = 0; i < 3; ++i)
    EXPECT_NEAR(x(i, 0).convert_to<double>(), expected(i, 0), 1e-12);
}

TEST_F(LUDecompositionTest, DecimalFromDecimalMatrix) {
  DecimalMatrix m(Matrix{{1.0, 2.0}, {3.0, 4.0}});
  LUDecomposition lu(m);
  static_assert(std::is_same_v<decltype(lu), LUDecompositionDecimal>);

  // 1/3 is not representable, but the determinant is exact to ~50 digits
  const Decimal error = abs(lu.det() + Decimal(2));
  EXPECT_LT(error, Decimal("1e-45"));
}

TEST_F(LUDecompositionTest, DecimalSolvesIllConditionedSystem) {
  const size_t n = 6;
  Matrix h = hilbert(n);
  Matrix ones(n, 1, 1.0);
  Matrix rhs = h * ones;

  LUDecompositionDecimal lu(h);
  DecimalMatrix x = lu.solve(DecimalMatrix(rhs));
  for (size_t i = 0; i < n; ++i)
    EXPECT_NEAR(x(i, 0).convert_to<double>(), 1.0, 1e-6);
}

TEST_F(LUDecompositionTest, DecimalSingularThrows) {
  LUDecompositionDecimal lu(Matrix{{1.0, 2.0}, {2.0, 4.0}});
  EXPECT_FALSE(lu.is_nonsingular());
  EXPECT_THROW(lu.solve(DecimalMatrix(Matrix{{1.0}, {1.0}})),
               dotnum::singular_matrix);
}
