#pragma once

#include <cmath>
#include <limits>

#include "types.hpp"

namespace cachematrix {

// Largest absolute deviation of m from the identity matrix; infinity if m is not square
inline double identityResidual(const Matrix& m) {
    if (m.rows() != m.cols()) {
        return std::numeric_limits<double>::infinity();
    }
    if (m.size() == 0) {
        return 0.0;
    }
    if (m.hasNaN()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return (m - Matrix::Identity(m.rows(), m.cols())).cwiseAbs().maxCoeff();
}

// Exact comparison when absTol is 0
inline bool isIdentity(const Matrix& m, double absTol = 0.0) {
    const double residual = identityResidual(m);
    return !std::isnan(residual) && residual <= absTol;
}

// [[1, -1/k], [-1/k, 1]]; for powers of two the inverse reproduces the identity exactly
inline Matrix offDiagonalMatrix(double k) {
    return Matrix{{1.0, -1.0 / k}, {-1.0 / k, 1.0}};
}

}  // namespace cachematrix
