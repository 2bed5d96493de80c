#pragma once

#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "format.hpp"
#include "types.hpp"
#include "utility.hpp"

namespace cachematrix {

// Anything constructed from a Matrix value with setValue()/getValue() accessors
template <class T>
concept CachingMatrix = requires(T& t, const T& ct, Matrix v) {
    { t.setValue(std::move(v)) };
    { ct.getValue() } -> std::convertible_to<const Matrix&>;
};

template <class T>
using MakeMatrix = std::function<T(const Matrix&)>;

template <class T>
using SolveMatrix = std::function<Matrix(T&, const SolveOptions&)>;

struct HarnessOptions {
    std::vector<double> exactScales  = {2.0, 4.0, 8.0, 16.0};  // K values of [[1, -1/K], [-1/K, 1]]
    int                 exactRepeats = 3;                      // Inversions per exact matrix
    Eigen::Index        size         = 6;                      // Dimension of the random matrices
    int                 trials       = 4;                      // Number of random matrices
    std::uint32_t       seed         = 5489u;                  // Seed for the random matrices
    double              tol          = 1e-4;                   // Passed through to the inversion routine
    double              absTol       = 1e-8;                   // Per-entry tolerance on the random products
    bool                verbose      = false;                  // Print every product
};

struct HarnessReport {
    size_t                   checks   = 0;
    size_t                   failures = 0;
    std::vector<std::string> messages = {};  // One entry per failed check

    bool success() const { return failures == 0; }

    void check(bool ok, const std::string& what) {
        ++checks;
        if (!ok) {
            ++failures;
            messages.push_back(what);
        }
    }

    void fail(const std::string& what) { check(false, what); }
};

// n x n matrix with standard normal entries
Matrix randomNormalMatrix(Eigen::Index n, std::mt19937& rng);

/**
 * @brief  Exercise a caching matrix type through a factory and an invert accessor.
 *
 * Exact suite: for every K in options.exactScales, builds [[1, -1/K], [-1/K, 1]],
 * inverts it options.exactRepeats times and checks that inverse * value and
 * value * inverse are exactly the identity, and that repeated calls return the
 * same result as the first one.
 *
 * Random suite: builds options.trials random options.size x options.size
 * matrices, inverts each twice with tol = options.tol and checks both products
 * against the identity within options.absTol.
 *
 * Exceptions thrown by make or invert are recorded as failed checks.
 *
 * @param make      Builds the object under test from an initial value
 * @param invert    Returns the inverse of the object, given pass-through options
 * @param options   Suite parameters
 * @return HarnessReport
 */
template <CachingMatrix T>
HarnessReport matrixTest(const MakeMatrix<T>& make, const SolveMatrix<T>& invert, const HarnessOptions& options = {}) {
    HarnessReport report;

    for (const double k : options.exactScales) {
        try {
            T                     m = make(offDiagonalMatrix(k));
            std::optional<Matrix> first;
            for (int i = 1; i <= options.exactRepeats; ++i) {
                const Matrix  inverse = invert(m, SolveOptions{});
                const Matrix& value   = m.getValue();
                const Matrix  idL     = inverse * value;
                const Matrix  idR     = value * inverse;
                if (options.verbose) {
                    fmt::print("K = {}, call {}:\n{}\n{}\n", k, i, formatMatrix(idL), formatMatrix(idR));
                }

                report.check(isIdentity(idL), fmt::format("K = {}, call {}: inverse * value is not the identity", k, i));
                report.check(isIdentity(idR), fmt::format("K = {}, call {}: value * inverse is not the identity", k, i));
                if (first.has_value()) {
                    report.check(inverse == *first, fmt::format("K = {}, call {}: result differs from the first call", k, i));
                } else {
                    first = inverse;
                }
            }
        } catch (const std::exception& e) {
            report.fail(fmt::format("K = {}: {}", k, e.what()));
        }
    }

    std::mt19937       rng(options.seed);
    const SolveOptions solveOptions{.tol = options.tol};
    for (int trial = 1; trial <= options.trials; ++trial) {
        try {
            T             m     = make(randomNormalMatrix(options.size, rng));
            const Matrix& value = m.getValue();
            const Matrix  first = invert(m, solveOptions);
            const Matrix  idL   = first * value;
            const Matrix  again = invert(m, solveOptions);
            const Matrix  idR   = value * again;
            if (options.verbose) {
                fmt::print("random trial {}:\n{}\n{}\n", trial, formatMatrix(idL), formatMatrix(idR));
            }

            report.check(isIdentity(idL, options.absTol),
                         fmt::format("random trial {}: inverse * value is off by {:g}", trial, identityResidual(idL)));
            report.check(isIdentity(idR, options.absTol),
                         fmt::format("random trial {}: value * inverse is off by {:g}", trial, identityResidual(idR)));
            report.check(again == first, fmt::format("random trial {}: second call differs from the first", trial));
        } catch (const std::exception& e) {
            report.fail(fmt::format("random trial {}: {}", trial, e.what()));
        }
    }

    return report;
}

}  // namespace cachematrix

template <>
struct fmt::formatter<cachematrix::HarnessReport> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const cachematrix::HarnessReport& report, fmt::format_context& ctx) const {
        auto out = fmt::format_to(ctx.out(), "{} checks, {} failures", report.checks, report.failures);
        for (const auto& message : report.messages) {
            out = fmt::format_to(out, "\n  {}", message);
        }
        return out;
    }
};
