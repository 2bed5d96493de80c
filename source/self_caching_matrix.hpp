#pragma once

#include <optional>
#include <utility>

#include "solve.hpp"
#include "types.hpp"

namespace cachematrix {

/**
 * @brief Matrix holder that manages the cache of its own inverse.
 *
 * The inverse is computed lazily on the first getInverse() after construction
 * or setValue(), and returned from the cache until the value changes again.
 * There is no way to write the cached inverse from outside, so whenever it is
 * present it belongs to the current value.
 *
 * Not thread-safe: concurrent getInverse() calls on one instance must be
 * serialized by the caller.
 */
class SelfCachingMatrix {
   public:
    SelfCachingMatrix() : SelfCachingMatrix(placeholderMatrix()) {}
    explicit SelfCachingMatrix(Matrix value, InverseSolver solver = defaultInverseSolver());

    // Replace the value and invalidate the cached inverse
    void setValue(Matrix value);

    const Matrix& getValue() const { return value_; }

    /**
     * @brief  Get the inverse of the current value.
     *
     * Errors raised by the inversion routine (e.g. SingularMatrixError) propagate
     * to the caller and leave the cache empty.
     *
     * @param options           Passed unchanged to the inversion routine
     * @return const Matrix&    Cached inverse, valid until the next setValue()
     */
    const Matrix& getInverse(const SolveOptions& options = {});

    bool hasCachedInverse() const { return inverse_.has_value(); }

   private:
    Matrix                value_   = {};
    std::optional<Matrix> inverse_ = {};
    InverseSolver         solver_  = {};
};

// Forwards to m.getInverse(options)
inline const Matrix& selfCachingSolve(SelfCachingMatrix& m, const SolveOptions& options = {}) {
    return m.getInverse(options);
}

}  // namespace cachematrix
