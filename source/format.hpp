#pragma once

#include <string>

#include "externally_cached_matrix.hpp"
#include "self_caching_matrix.hpp"
#include "types.hpp"

// ============================================================================
// Matrix Formatting for fmt::format
#include "fmt/core.h"
#include "fmt/format.h"

namespace cachematrix {

inline std::string formatMatrix(const Matrix& m) {
    std::string result;
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            result += fmt::format("{:>10.4f}", m(i, j));
        }
        result += "\n";
    }
    return result;
}

}  // namespace cachematrix

template <>
struct fmt::formatter<cachematrix::ExternallyCachedMatrix> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const cachematrix::ExternallyCachedMatrix& m, fmt::format_context& ctx) const {
        const auto& inverse = m.getCachedInverse();
        return fmt::format_to(ctx.out(), "value = \n{}\ninverse = \n{}",
                              cachematrix::formatMatrix(m.getValue()),
                              inverse.has_value() ? cachematrix::formatMatrix(*inverse) : std::string("  (not cached)\n"));
    }
};

template <>
struct fmt::formatter<cachematrix::SelfCachingMatrix> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const cachematrix::SelfCachingMatrix& m, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "value = \n{}\ninverse: {}\n",
                              cachematrix::formatMatrix(m.getValue()),
                              m.hasCachedInverse() ? "cached" : "not cached");
    }
};
