#include "externally_cached_matrix.hpp"

#include "solve.hpp"
#include "trace.hpp"

namespace cachematrix {

Matrix computeOrFetchInverse(ExternallyCachedMatrix& m, const SolveOptions& options) {
    return computeOrFetchInverse(m, defaultInverseSolver(), options);
}

Matrix computeOrFetchInverse(ExternallyCachedMatrix& m, const InverseSolver& solver, const SolveOptions& options) {
    if (const auto& cached = m.getCachedInverse(); cached.has_value()) {
        return *cached;
    }

    const Matrix& value = m.getValue();
    traceComputingInverse(value.rows(), value.cols());
    Matrix inverse = solver(value, options);
    m.setCachedInverse(inverse);
    return inverse;
}

}  // namespace cachematrix
