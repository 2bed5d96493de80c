#include "harness.hpp"

namespace cachematrix {

Matrix randomNormalMatrix(Eigen::Index n, std::mt19937& rng) {
    std::normal_distribution<double> normal(0.0, 1.0);

    Matrix m(n, n);
    for (Eigen::Index j = 0; j < n; ++j) {
        for (Eigen::Index i = 0; i < n; ++i) {
            m(i, j) = normal(rng);
        }
    }
    return m;
}

}  // namespace cachematrix
