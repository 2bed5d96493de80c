#include <chrono>
#include <random>
#include <vector>

#include "cachematrix.hpp"
#include "matplot/matplot.h"

namespace plt = matplot;

using namespace cachematrix;

// Seconds spent in one call of f
template <typename F>
double timeCall(F&& f) {
    const auto start = std::chrono::high_resolution_clock::now();
    f();
    const auto end = std::chrono::high_resolution_clock::now();

    const std::chrono::duration<double> elapsed = end - start;
    return elapsed.count();
}

int main() {
    fmt::print("Inverse cache example: first getInverse() vs cached calls\n");

    std::mt19937        rng(42);
    std::vector<double> sizes, firstCall, cachedCall, residual;

    for (Eigen::Index n = 10; n <= 300; n += 10) {
        SelfCachingMatrix m{randomNormalMatrix(n, rng)};

        const double tFirst  = timeCall([&] { m.getInverse(); });
        const double tCached = timeCall([&] { m.getInverse(); });

        sizes.push_back(static_cast<double>(n));
        firstCall.push_back(tFirst * 1e3);
        cachedCall.push_back(tCached * 1e3);
        residual.push_back(identityResidual(m.getValue() * m.getInverse()));

        fmt::print("n = {:>3}: first {:.4f} ms, cached {:.6f} ms, |A*inv(A) - I| = {:.3g}\n",
                   n, firstCall.back(), cachedCall.back(), residual.back());
    }

    auto fig = plt::figure(true);
    fig->size(1280, 720);
    plt::tiledlayout(2, 1);

    auto ax1 = plt::nexttile();
    plt::hold(ax1, plt::on);
    plt::semilogy(ax1, sizes, firstCall)->display_name("first call (inversion)");
    plt::semilogy(ax1, sizes, cachedCall)->display_name("cached call");
    ax1->xlabel("Matrix dimension n");
    ax1->ylabel("Time (ms)");
    ax1->title("getInverse() cost");
    ax1->grid(plt::on);
    plt::legend(ax1);

    auto ax2 = plt::nexttile();
    plt::semilogy(ax2, sizes, residual);
    ax2->xlabel("Matrix dimension n");
    ax2->ylabel("max |A*inv(A) - I|");
    ax2->title("Identity residual");
    ax2->grid(plt::on);

    plt::show();
    return 0;
}
