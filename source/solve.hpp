#pragma once

#include <stdexcept>
#include <string>

#include "types.hpp"

namespace cachematrix {

/**
 * @brief Raised when a matrix is (numerically) singular for the requested tolerance.
 */
class SingularMatrixError : public std::runtime_error {
   public:
    SingularMatrixError(const std::string& what, double rcond)
        : std::runtime_error(what), rcond_(rcond) {}

    double rcond() const { return rcond_; }

   private:
    double rcond_ = 0.0;
};

/**
 * @brief  Compute the inverse of a square matrix.
 *
 * Uses a partial-pivoting LU factorization. The reciprocal condition number
 * is estimated from the factorization and compared against options.tol.
 *
 * @param a         Square, non-empty matrix
 * @param options   Tolerance for detecting singularity
 * @return Matrix   The inverse of a
 *
 * @throws std::invalid_argument  if a is empty or not square
 * @throws SingularMatrixError    if rcond(a) < options.tol
 */
Matrix solve(const Matrix& a, const SolveOptions& options = {});

/**
 * @brief  Solve the linear system a * x = b.
 *
 * @param a         Square, non-empty coefficient matrix
 * @param b         Right-hand side with a.rows() rows
 * @param options   Tolerance for detecting singularity
 * @return Matrix   The solution x
 */
Matrix solve(const Matrix& a, const Matrix& b, const SolveOptions& options = {});

// solve(a, options) wrapped as an InverseSolver
InverseSolver defaultInverseSolver();

}  // namespace cachematrix
