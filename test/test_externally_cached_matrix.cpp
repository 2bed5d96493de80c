#include <vector>

#include <doctest/doctest.h>

#include "cachematrix.hpp"

using namespace cachematrix;

namespace {

// Inversion routine that counts calls and records the options it receives
struct RecordingSolver {
    std::vector<SolveOptions> received;

    InverseSolver solver() {
        return [this](const Matrix& a, const SolveOptions& options) {
            received.push_back(options);
            return solve(a, options);
        };
    }
};

}  // namespace

TEST_CASE("ExternallyCachedMatrix - Accessors") {
    SUBCASE("Default construction") {
        ExternallyCachedMatrix m;
        CHECK(m.getValue().rows() == 1);
        CHECK(m.getValue().cols() == 1);
        CHECK_FALSE(m.hasCachedInverse());
        CHECK_FALSE(m.getCachedInverse().has_value());
    }

    SUBCASE("Construction from a value") {
        const Matrix value{{1.0, 2.0}, {3.0, 4.0}};
        ExternallyCachedMatrix m{value};
        CHECK(m.getValue() == value);
        CHECK_FALSE(m.hasCachedInverse());
    }

    SUBCASE("setValue replaces the value and clears the cache") {
        ExternallyCachedMatrix m{offDiagonalMatrix(2.0)};
        m.setCachedInverse(solve(m.getValue()));
        REQUIRE(m.hasCachedInverse());

        const Matrix next{{2.0, 0.0}, {0.0, 2.0}};
        m.setValue(next);
        CHECK(m.getValue() == next);
        CHECK_FALSE(m.hasCachedInverse());
    }

    SUBCASE("Copies own their value and cache") {
        ExternallyCachedMatrix m{offDiagonalMatrix(4.0)};
        (void)computeOrFetchInverse(m);

        ExternallyCachedMatrix copy = m;
        copy.setValue(Matrix::Identity(2, 2));
        CHECK(m.hasCachedInverse());
        CHECK(m.getValue() == offDiagonalMatrix(4.0));
        CHECK_FALSE(copy.hasCachedInverse());
    }
}

TEST_CASE("ExternallyCachedMatrix - Inconsistent cache is accepted") {
    ExternallyCachedMatrix m{offDiagonalMatrix(2.0)};
    const Matrix wrong{{7.0, 7.0}, {7.0, 7.0}};

    m.setCachedInverse(wrong);
    REQUIRE(m.getCachedInverse().has_value());
    CHECK(*m.getCachedInverse() == wrong);

    // computeOrFetchInverse cannot tell the stored matrix is wrong
    const Matrix fetched = computeOrFetchInverse(m);
    CHECK(fetched == wrong);
    CHECK_FALSE(isIdentity(m.getValue() * fetched));
}

TEST_CASE("computeOrFetchInverse") {
    SUBCASE("K = 2 scenario") {
        ExternallyCachedMatrix m{offDiagonalMatrix(2.0)};
        const Matrix           inv = computeOrFetchInverse(m);

        CHECK(inv(0, 0) == doctest::Approx(4.0 / 3.0));
        CHECK(inv(0, 1) == doctest::Approx(2.0 / 3.0));
        CHECK(isIdentity(m.getValue() * inv));
        CHECK(isIdentity(inv * m.getValue()));
        REQUIRE(m.hasCachedInverse());
        CHECK(*m.getCachedInverse() == inv);
    }

    SUBCASE("Computes once per value") {
        RecordingSolver        recorder;
        ExternallyCachedMatrix m{offDiagonalMatrix(8.0)};

        const Matrix first  = computeOrFetchInverse(m, recorder.solver());
        const Matrix second = computeOrFetchInverse(m, recorder.solver());
        const Matrix third  = computeOrFetchInverse(m, recorder.solver());
        CHECK(recorder.received.size() == 1);
        CHECK(second == first);
        CHECK(third == first);

        m.setValue(offDiagonalMatrix(16.0));
        const Matrix fourth = computeOrFetchInverse(m, recorder.solver());
        CHECK(recorder.received.size() == 2);
        CHECK(fourth != first);
        CHECK(isIdentity(m.getValue() * fourth));
    }

    SUBCASE("Tolerance is passed through unchanged") {
        RecordingSolver        recorder;
        ExternallyCachedMatrix m{offDiagonalMatrix(2.0)};

        (void)computeOrFetchInverse(m, recorder.solver(), SolveOptions{.tol = 1e-4});
        REQUIRE(recorder.received.size() == 1);
        CHECK(recorder.received[0].tol == 1e-4);
    }

    SUBCASE("Singular value propagates and leaves the cache empty") {
        ExternallyCachedMatrix m{Matrix{{1.0, 2.0}, {2.0, 4.0}}};
        CHECK_THROWS_AS(computeOrFetchInverse(m), SingularMatrixError);
        CHECK_FALSE(m.hasCachedInverse());
    }

    SUBCASE("Non-square value propagates") {
        ExternallyCachedMatrix m{Matrix{{1.0, 2.0, 3.0}}};
        CHECK_THROWS_AS(computeOrFetchInverse(m), std::invalid_argument);
        CHECK_FALSE(m.hasCachedInverse());
    }
}
