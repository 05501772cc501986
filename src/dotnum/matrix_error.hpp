#ifndef DOTNUM_MATRIX_ERROR_HPP
#define DOTNUM_MATRIX_ERROR_HPP

#include <exception>
namespace dotnum {
struct divide_by_zero : public std::exception {
  virtual const char* what() const throw() {
    return "division by zero occured!";
  }
};
struct bad_size : public std::exception {
  virtual const char* what() const throw() {
    return "matrix row or column size is incompatible";
  }
};
struct bad_argument : public std::exception {
  virtual const char* what() const throw() {
    return "invalid argument to function";
  }
};
struct out_of_range : public std::exception {
  virtual const char* what() const throw() {
    return "row or column index is out of range";
  }
};

// Operand shapes are incompatible, e.g. a right-hand side with the wrong
// number of rows
struct dimension_mismatch : public bad_size {
  const char* what() const throw() {
    return "matrix dimensions must agree";
  }
};
struct not_square : public bad_size {
  const char* what() const throw() { return "matrix must be square"; }
};

// LU solve on a matrix with a zero pivot
struct singular_matrix : public std::exception {
  const char* what() const throw() { return "matrix is singular"; }
};

// QR solve on a matrix without full column rank
struct rank_deficient : public std::exception {
  const char* what() const throw() { return "matrix is rank deficient"; }
};
}  // namespace dotnum
#endif
