#include "dotnum/matrix.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include "dotnum/linear_solve.hpp"
#include "dotnum/logging.hpp"
#include "dotnum/matrix_error.hpp"
#include "test_utils.hpp"

TEST(MatrixTest, BasicConstruction) {
  Matrix m1(size_t(3), size_t(4));
  EXPECT_EQ(m1.rows(), size_t(3));
  EXPECT_EQ(m1.cols(), size_t(4));
  EXPECT_EQ(m1.size(), size_t(12));
  EXPECT_DOUBLE_EQ(m1(2, 3), 0.0);

  Matrix m2(size_t(2), size_t(2), 5.0);
  EXPECT_DOUBLE_EQ(m2(0, 0), 5.0);
  EXPECT_DOUBLE_EQ(m2(0, 1), 5.0);
  EXPECT_DOUBLE_EQ(m2(1, 0), 5.0);
  EXPECT_DOUBLE_EQ(m2(1, 1), 5.0);

  Matrix m3 = {{1.0, 2.0}, {3.0, 4.0}};
  EXPECT_DOUBLE_EQ(m3(0, 0), 1.0);
  EXPECT_DOUBLE_EQ(m3(0, 1), 2.0);
  EXPECT_DOUBLE_EQ(m3(1, 0), 3.0);
  EXPECT_DOUBLE_EQ(m3(1, 1), 4.0);

  Matrix empty;
  EXPECT_TRUE(empty.empty());
  EXPECT_FALSE(m3.empty());
}

TEST(MatrixTest, RowMajorVectorConstructor) {
  Matrix m(size_t(2), size_t(3), std::vector<double>{1, 2, 3, 4, 5, 6});
  EXPECT_DOUBLE_EQ(m(0, 2), 3.0);
  EXPECT_DOUBLE_EQ(m(1, 0), 4.0);
  EXPECT_EQ(m.index(1, 2), size_t(5));
  EXPECT_DOUBLE_EQ(m.data()[m.index(1, 2)], 6.0);

  EXPECT_THROW(Matrix(size_t(2), size_t(2), std::vector<double>{1, 2, 3}),
               dotnum::bad_argument);
  EXPECT_THROW((Matrix{{1.0, 2.0}, {3.0}}), dotnum::bad_argument);
}

TEST(MatrixTest, CopyHasValueSemantics) {
  Matrix a = {{1.0, 2.0}, {3.0, 4.0}};
  Matrix b = a;
  b(0, 0) = 10.0;
  EXPECT_DOUBLE_EQ(a(0, 0), 1.0);

  std::vector<double> buffer = a.array_copy();
  buffer[0] = 42.0;
  EXPECT_DOUBLE_EQ(a(0, 0), 1.0);
}

TEST(MatrixTest, CheckedAccess) {
  Matrix m = {{1.0, 2.0}, {3.0, 4.0}};
  m.set(1, 0, 7.0);
  EXPECT_DOUBLE_EQ(m.get(1, 0), 7.0);
  EXPECT_DOUBLE_EQ(m.at(1, 1), 4.0);
  EXPECT_THROW(m.at(2, 0), dotnum::out_of_range);
  EXPECT_THROW(m.at(0, 2), dotnum::out_of_range);
}

TEST(MatrixTest, TypeConversionConstructor) {
  dotnum::Matrix<float> f = {{1.5f, 2.5f}, {3.5f, 4.5f}};
  Matrix d(f);
  EXPECT_DOUBLE_EQ(d(0, 0), 1.5);
  EXPECT_DOUBLE_EQ(d(1, 1), 4.5);
}

TEST(MatrixTest, BasicOperations) {
  Matrix m1 = {{1.0, 2.0}, {3.0, 4.0}};
  Matrix m2 = {{5.0, 6.0}, {7.0, 8.0}};

  assert_matrix_near(m1 + m2, Matrix{{6.0, 8.0}, {10.0, 12.0}});
  assert_matrix_near(m2 - m1, Matrix{{4.0, 4.0}, {4.0, 4.0}});
  assert_matrix_near(-m1, Matrix{{-1.0, -2.0}, {-3.0, -4.0}});
  assert_matrix_near(m1 * 2.0, Matrix{{2.0, 4.0}, {6.0, 8.0}});
  assert_matrix_near(2.0 * m1, Matrix{{2.0, 4.0}, {6.0, 8.0}});

  Matrix m3 = m1;
  m3 += m2;
  assert_matrix_near(m3, Matrix{{6.0, 8.0}, {10.0, 12.0}});
  m3 -= m2;
  assert_matrix_near(m3, m1);
  m3 *= 3.0;
  assert_matrix_near(m3, Matrix{{3.0, 6.0}, {9.0, 12.0}});

  Matrix wrong(size_t(3), size_t(2));
  EXPECT_THROW(m1 + wrong, dotnum::dimension_mismatch);
  EXPECT_THROW(m1 -= wrong, dotnum::dimension_mismatch);
}

TEST(MatrixTest, MatrixMultiplication) {
  Matrix m1 = {{1.0, 2.0}, {3.0, 4.0}};
  Matrix m2 = {{5.0, 6.0}, {7.0, 8.0}};

  Matrix m3 = m1 * m2;
  EXPECT_DOUBLE_EQ(m3(0, 0), 19.0);
  EXPECT_DOUBLE_EQ(m3(0, 1), 22.0);
  EXPECT_DOUBLE_EQ(m3(1, 0), 43.0);
  EXPECT_DOUBLE_EQ(m3(1, 1), 50.0);

  Matrix rect = {{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}};
  Matrix col = Matrix::column_vector({1.0, 1.0, 1.0});
  assert_matrix_near(rect * col, Matrix{{6.0}, {15.0}});

  EXPECT_THROW(col * rect, dotnum::dimension_mismatch);
}

TEST(MatrixTest, LargeProductMatchesNaiveProduct) {
  // Large enough to go through the blocked OpenMP kernel
  const size_t m = 90, inner = 70, n = 80;
  Matrix a(m, inner);
  Matrix b(inner, n);
  for (size_t i = 0; i < m; ++i)
    for (size_t k = 0; k < inner; ++k)
      a(i, k) = std::sin(double(i * inner + k));
  for (size_t k = 0; k < inner; ++k)
    for (size_t j = 0; j < n; ++j)
      b(k, j) = std::cos(double(k * n + j));

  Matrix expected(m, n);
  for (size_t i = 0; i < m; ++i)
    for (size_t j = 0; j < n; ++j) {
      double s = 0.0;
      for (size_t k = 0; k < inner; ++k)
        s += a(i, k) * b(k, j);
      expected(i, j) = s;
    }

  assert_matrix_near(a * b, expected, 1e-9);

  Matrix at = a.transpose();
  ASSERT_EQ(at.rows(), inner);
  ASSERT_EQ(at.cols(), m);
  for (size_t i = 0; i < m; ++i)
    for (size_t k = 0; k < inner; ++k)
      EXPECT_DOUBLE_EQ(at(k, i), a(i, k));
}

TEST(MatrixTest, ElementwiseOperations) {
  Matrix a = {{1.0, 2.0}, {4.0, 8.0}};
  Matrix b = {{2.0, 2.0}, {2.0, 4.0}};

  assert_matrix_near(a.array_times(b), Matrix{{2.0, 4.0}, {8.0, 32.0}});
  assert_matrix_near(a.array_right_divide(b), Matrix{{0.5, 1.0}, {2.0, 2.0}});
  assert_matrix_near(a.array_left_divide(b), Matrix{{2.0, 1.0}, {0.5, 0.5}});

  Matrix c = a;
  c.array_times_equals(b);
  assert_matrix_near(c, Matrix{{2.0, 4.0}, {8.0, 32.0}});

  Matrix d = a;
  d.blend_equals(b, 0.5);
  assert_matrix_near(d, Matrix{{1.5, 2.0}, {3.0, 6.0}});

  Matrix wrong(size_t(1), size_t(2));
  EXPECT_THROW(a.array_times(wrong), dotnum::dimension_mismatch);
  EXPECT_THROW(a.blend_equals(wrong, 0.5), dotnum::dimension_mismatch);
}

TEST(MatrixTest, TransposeAndTrace) {
  Matrix m1 = {{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}};

  Matrix m2 = m1.transpose();
  EXPECT_EQ(m2.rows(), size_t(3));
  EXPECT_EQ(m2.cols(), size_t(2));
  EXPECT_DOUBLE_EQ(m2(0, 0), 1.0);
  EXPECT_DOUBLE_EQ(m2(0, 1), 4.0);
  EXPECT_DOUBLE_EQ(m2(1, 0), 2.0);
  EXPECT_DOUBLE_EQ(m2(1, 1), 5.0);
  EXPECT_DOUBLE_EQ(m2(2, 0), 3.0);
  EXPECT_DOUBLE_EQ(m2(2, 1), 6.0);

  EXPECT_DOUBLE_EQ(m1.trace(), 6.0);
  Matrix m3 = {{1.0, 2.0}, {3.0, 4.0}};
  EXPECT_DOUBLE_EQ(m3.trace(), 5.0);
}

TEST(MatrixTest, Norms) {
  Matrix m = {{1.0, -2.0}, {3.0, 4.0}};
  EXPECT_DOUBLE_EQ(m.norm1(), 6.0);
  EXPECT_DOUBLE_EQ(m.norm_inf(), 7.0);
  EXPECT_NEAR(m.norm_f(), std::sqrt(30.0), 1e-12);
}

TEST(MatrixTest, HypotAvoidsOverflow) {
  EXPECT_DOUBLE_EQ(Matrix::hypot(3.0, 4.0), 5.0);
  EXPECT_DOUBLE_EQ(Matrix::hypot(0.0, 0.0), 0.0);
  EXPECT_NEAR(Matrix::hypot(1e200, 1e200) / 1e200, std::sqrt(2.0), 1e-12);
  EXPECT_NEAR(Matrix::hypot(1e-200, 1e-200) / 1e-200, std::sqrt(2.0), 1e-12);
}

TEST(MatrixTest, StaticFactoryMethods) {
  assert_matrix_near(Matrix::zeros(2, 2), Matrix{{0.0, 0.0}, {0.0, 0.0}});
  assert_matrix_near(Matrix::identity(2, 3),
                     Matrix{{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}});
  assert_matrix_near(Matrix::identity(2), Matrix{{1.0, 0.0}, {0.0, 1.0}});
  assert_matrix_near(Matrix::diagonal_matrix({2.0, 3.0}),
                     Matrix{{2.0, 0.0}, {0.0, 3.0}});

  Matrix row = Matrix::row_vector({1.0, 2.0, 3.0});
  EXPECT_EQ(row.rows(), size_t(1));
  EXPECT_EQ(row.cols(), size_t(3));
  Matrix col = Matrix::column_vector({1.0, 2.0, 3.0});
  EXPECT_EQ(col.rows(), size_t(3));
  EXPECT_EQ(col.cols(), size_t(1));
  EXPECT_DOUBLE_EQ(col(2, 0), 3.0);
}

TEST(MatrixTest, SubMatrixAndRowGather) {
  Matrix m1 = {{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}, {7.0, 8.0, 9.0}};

  Matrix sub = m1.get_matrix(0, 1, 1, 2);
  assert_matrix_near(sub, Matrix{{2.0, 3.0}, {5.0, 6.0}});

  Matrix gathered = m1.get_array_row_matrix({2, 0}, 0, 1);
  assert_matrix_near(gathered, Matrix{{7.0, 8.0}, {1.0, 2.0}});

  EXPECT_THROW(m1.get_matrix(0, 3, 0, 0), dotnum::out_of_range);
  EXPECT_THROW(m1.get_array_row_matrix({3}, 0, 0), dotnum::out_of_range);
}

TEST(MatrixTest, Symmetry) {
  EXPECT_TRUE((Matrix{{1.0, 2.0}, {2.0, 3.0}}).is_symmetric());
  EXPECT_FALSE((Matrix{{1.0, 2.0}, {2.000001, 3.0}}).is_symmetric());
  EXPECT_FALSE((Matrix{{1.0, 2.0, 3.0}, {2.0, 3.0, 4.0}}).is_symmetric());
  EXPECT_TRUE((Matrix{{1.0, 2.0}, {3.0, 4.0}}).is_square());
}

TEST(MatrixTest, StringOutput) {
  Matrix m = {{1.0, 2.0}, {3.0, 4.0}};
  EXPECT_EQ(m.to_string(), "dim: 2x2\n1 2 \n3 4 \n");

  std::ostringstream os;
  os << m;
  EXPECT_EQ(os.str(), "[[1, 2],\n [3, 4]]");
}

// ===== Linear solve conveniences =====

TEST(LinearSolveTest, SquareSystem) {
  Matrix A = {{4.0, 1.0}, {1.0, 3.0}};
  Matrix b = {{1.0}, {2.0}};

  Matrix x = dotnum::solve(A, b);
  assert_matrix_near(A * x, b, 1e-12);
}

TEST(LinearSolveTest, OverdeterminedSystemUsesLeastSquares) {
  Matrix A = {{1.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}};
  Matrix b = {{1.0}, {1.0}, {2.0}};

  Matrix x = dotnum::solve(A, b);
  assert_matrix_near(x, Matrix{{1.0}, {1.0}}, 1e-12);

  // Inconsistent system: normal equations give x = (1/3, 1/3)
  Matrix c = {{0.0}, {0.0}, {1.0}};
  assert_matrix_near(dotnum::solve(A, c), Matrix{{1.0 / 3.0}, {1.0 / 3.0}},
                     1e-12);
}

TEST(LinearSolveTest, SolveTranspose) {
  Matrix A = {{2.0, 1.0}, {1.0, 3.0}};
  Matrix B = {{4.0, 7.0}};

  assert_matrix_near(dotnum::solve_transpose(A, B), Matrix{{1.0, 2.0}},
                     1e-12);
}

TEST(LinearSolveTest, DeterminantAndInverse) {
  Matrix m1 = {{4.0, 7.0}, {2.0, 6.0}};

  EXPECT_NEAR(dotnum::det(m1), 10.0, 1e-12);

  Matrix inv = dotnum::inverse(m1);
  EXPECT_NEAR(inv(0, 0), 0.6, 1e-10);
  EXPECT_NEAR(inv(0, 1), -0.7, 1e-10);
  EXPECT_NEAR(inv(1, 0), -0.2, 1e-10);
  EXPECT_NEAR(inv(1, 1), 0.4, 1e-10);

  assert_matrix_near(m1 * inv, Matrix::identity(2), 1e-10);
}

TEST(LinearSolveTest, Determinant) {
  Matrix m1 = {{4.0, 3.0}, {6.0, 3.0}};
  Matrix m2 = {{1.0, 2.0}, {3.0, 4.0}};
  Matrix m3 = {{1.0, 0.0, 0.0}, {0.0, 2.0, 0.0}, {0.0, 0.0, 3.0}};
  // Odd permutation
  Matrix p = {{0.0, 1.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 0.0, 1.0}};
  Matrix upper = {{2.0, 5.0, 1.0}, {0.0, 3.0, 7.0}, {0.0, 0.0, 4.0}};

  EXPECT_NEAR(dotnum::det(m1), -6.0, 1e-12);
  EXPECT_NEAR(dotnum::det(m2), -2.0, 1e-12);
  EXPECT_NEAR(dotnum::det(m3), 6.0, 1e-12);
  EXPECT_NEAR(dotnum::det(p), -1.0, 1e-12);
  EXPECT_NEAR(dotnum::det(upper), 24.0, 1e-12);

  EXPECT_THROW(dotnum::det(Matrix(size_t(2), size_t(3))), dotnum::not_square);
}

TEST(LinearSolveTest, SingularInverseThrows) {
  Matrix singular = {{1.0, 2.0}, {2.0, 4.0}};
  EXPECT_THROW(dotnum::inverse(singular), dotnum::singular_matrix);
}

TEST(LoggingTest, SetLogLevel) {
  EXPECT_EQ(dotnum::logger()->name(), "dotnum");
  const auto previous = dotnum::logger()->level();

  dotnum::set_log_level(spdlog::level::debug);
  EXPECT_EQ(dotnum::logger()->level(), spdlog::level::debug);
  EXPECT_TRUE(dotnum::logger()->should_log(spdlog::level::debug));

  dotnum::set_log_level(spdlog::level::off);
  EXPECT_FALSE(dotnum::logger()->should_log(spdlog::level::critical));

  dotnum::set_log_level(previous);
  EXPECT_EQ(dotnum::logger()->level(), previous);
}
