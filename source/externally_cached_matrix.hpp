#pragma once

#include <optional>
#include <utility>

#include "solve.hpp"
#include "types.hpp"

namespace cachematrix {

/**
 * @brief Matrix holder with an externally managed inverse cache.
 *
 * The object stores a value and a slot for its inverse, but leaves it to the
 * caller to fill that slot. computeOrFetchInverse() below uses it correctly.
 *
 * @warning setCachedInverse() accepts any matrix. Nothing checks that it is the
 *          inverse of getValue(), so buggy or malicious callers can leave the
 *          object in an inconsistent state. getCachedInverse() is also empty
 *          right after construction or setValue() until someone stores an
 *          inverse. SelfCachingMatrix does not have either problem.
 */
class ExternallyCachedMatrix {
   public:
    ExternallyCachedMatrix() : value_(placeholderMatrix()) {}
    explicit ExternallyCachedMatrix(Matrix value) : value_(std::move(value)) {}

    // Replace the value and invalidate the cached inverse
    void setValue(Matrix value) {
        inverse_.reset();
        value_ = std::move(value);
    }

    const Matrix& getValue() const { return value_; }

    // Overwrite the cached inverse; candidate _must_ be the inverse of getValue()
    void setCachedInverse(Matrix candidate) { inverse_ = std::move(candidate); }

    const std::optional<Matrix>& getCachedInverse() const { return inverse_; }

    bool hasCachedInverse() const { return inverse_.has_value(); }

   private:
    Matrix                value_   = {};
    std::optional<Matrix> inverse_ = {};  // nullopt until an inverse is stored for value_
};

/**
 * @brief  Return the inverse of m, computing and storing it if not cached.
 *
 * Reads the cached inverse; when absent, inverts getValue() with the given
 * options and stores the result through setCachedInverse(). A wrong inverse
 * stored by other code is returned as-is.
 *
 * @param m         Matrix holder
 * @param options   Passed unchanged to the inversion routine
 * @return Matrix   The (possibly cached) inverse
 */
Matrix computeOrFetchInverse(ExternallyCachedMatrix& m, const SolveOptions& options = {});

// Same as above with an explicit inversion routine
Matrix computeOrFetchInverse(ExternallyCachedMatrix& m, const InverseSolver& solver, const SolveOptions& options = {});

}  // namespace cachematrix
