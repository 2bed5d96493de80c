#include <string>

#include <doctest/doctest.h>

#include "cachematrix.hpp"

using namespace cachematrix;

TEST_CASE("Matrix formatting") {
    const Matrix m{{1.0, -0.5}, {-0.5, 1.0}};
    CHECK(formatMatrix(m) == "    1.0000   -0.5000\n   -0.5000    1.0000\n");
    CHECK(formatMatrix(Matrix{}).empty());
}

TEST_CASE("Caching matrix formatting") {
    SUBCASE("Externally cached matrix") {
        ExternallyCachedMatrix m{Matrix{{2.0}}};
        const std::string before = fmt::format("{}", m);
        CHECK(before.find("not cached") != std::string::npos);

        (void)computeOrFetchInverse(m);
        const std::string after = fmt::format("{}", m);
        CHECK(after.find("not cached") == std::string::npos);
        CHECK(after.find("0.5000") != std::string::npos);
    }

    SUBCASE("Self-caching matrix") {
        SelfCachingMatrix m{Matrix{{4.0}}};
        CHECK(fmt::format("{}", m).find("inverse: not cached") != std::string::npos);

        (void)m.getInverse();
        CHECK(fmt::format("{}", m).find("inverse: cached") != std::string::npos);
    }

    SUBCASE("Harness report") {
        HarnessReport report;
        report.check(true, "ok");
        report.check(false, "broken");
        CHECK(fmt::format("{}", report) == "2 checks, 1 failures\n  broken");
    }
}
