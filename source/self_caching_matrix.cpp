#include "self_caching_matrix.hpp"

#include "trace.hpp"

namespace cachematrix {

SelfCachingMatrix::SelfCachingMatrix(Matrix value, InverseSolver solver)
    : value_(std::move(value)), solver_(std::move(solver)) {}

void SelfCachingMatrix::setValue(Matrix value) {
    inverse_.reset();
    value_ = std::move(value);
}

const Matrix& SelfCachingMatrix::getInverse(const SolveOptions& options) {
    if (!inverse_.has_value()) {
        traceComputingInverse(value_.rows(), value_.cols());
        // Store into the member so the result persists across calls
        inverse_ = solver_(value_, options);
    }
    return *inverse_;
}

}  // namespace cachematrix
