#pragma once

#include <functional>
#include <limits>

#include "Eigen/Dense"

namespace cachematrix {

using Matrix = Eigen::MatrixXd;

/**
 * @brief Optional parameters forwarded to the inversion routine.
 *
 * The caching matrices never inspect these, they only pass them through.
 */
struct SolveOptions {
    double tol = std::numeric_limits<double>::epsilon();  // Minimum reciprocal condition number

    bool operator==(const SolveOptions& other) const = default;
};

// Inversion routine: given a square matrix and options, returns its inverse
using InverseSolver = std::function<Matrix(const Matrix&, const SolveOptions&)>;

// Placeholder value for default-constructed matrices (1x1, not a number)
inline Matrix placeholderMatrix() {
    return Matrix::Constant(1, 1, std::numeric_limits<double>::quiet_NaN());
}

}  // namespace cachematrix
