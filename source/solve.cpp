#include "solve.hpp"

#include <Eigen/LU>

#include "fmt/core.h"

namespace cachematrix {

static void checkSquare(const Matrix& a) {
    if (a.size() == 0) {
        throw std::invalid_argument("solve: matrix is empty");
    }
    if (a.rows() != a.cols()) {
        throw std::invalid_argument(fmt::format("solve: matrix is not square ({} x {})", a.rows(), a.cols()));
    }
}

static Eigen::PartialPivLU<Matrix> factorize(const Matrix& a, const SolveOptions& options) {
    Eigen::PartialPivLU<Matrix> lu(a);

    // rcond() is 0 for an exactly singular factorization and NaN when a holds NaN
    const double rcond = lu.rcond();
    if (!(rcond >= options.tol)) {
        throw SingularMatrixError(
            fmt::format("system is computationally singular: reciprocal condition number = {:g}", rcond), rcond);
    }
    return lu;
}

Matrix solve(const Matrix& a, const SolveOptions& options) {
    checkSquare(a);
    return factorize(a, options).inverse();
}

Matrix solve(const Matrix& a, const Matrix& b, const SolveOptions& options) {
    checkSquare(a);
    if (b.rows() != a.rows()) {
        throw std::invalid_argument(
            fmt::format("solve: right-hand side has {} rows, expected {}", b.rows(), a.rows()));
    }
    return factorize(a, options).solve(b);
}

InverseSolver defaultInverseSolver() {
    return [](const Matrix& a, const SolveOptions& options) { return solve(a, options); };
}

}  // namespace cachematrix
