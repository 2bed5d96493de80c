#pragma once

#include "externally_cached_matrix.hpp"  // IWYU pragma: keep
#include "format.hpp"                    // IWYU pragma: keep
#include "harness.hpp"                   // IWYU pragma: keep
#include "self_caching_matrix.hpp"       // IWYU pragma: keep
#include "solve.hpp"                     // IWYU pragma: keep
#include "trace.hpp"                     // IWYU pragma: keep
#include "types.hpp"                     // IWYU pragma: keep
#include "utility.hpp"                   // IWYU pragma: keep

// Factories and accessors with the shapes matrixTest() expects
namespace cachematrix {

inline ExternallyCachedMatrix makeExternallyCachedMatrix(const Matrix& value) {
    return ExternallyCachedMatrix{value};
}

inline SelfCachingMatrix makeSelfCachingMatrix(const Matrix& value) {
    return SelfCachingMatrix{value};
}

inline HarnessReport testExternallyCachedMatrix(const HarnessOptions& options = {}) {
    return matrixTest<ExternallyCachedMatrix>(
        makeExternallyCachedMatrix,
        [](ExternallyCachedMatrix& m, const SolveOptions& opts) { return computeOrFetchInverse(m, opts); },
        options);
}

inline HarnessReport testSelfCachingMatrix(const HarnessOptions& options = {}) {
    return matrixTest<SelfCachingMatrix>(
        makeSelfCachingMatrix,
        [](SelfCachingMatrix& m, const SolveOptions& opts) { return selfCachingSolve(m, opts); },
        options);
}

}  // namespace cachematrix
