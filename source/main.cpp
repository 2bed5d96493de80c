#include <cstdlib>
#include <string>
#include <string_view>

#include "cachematrix.hpp"

namespace {

void usage() {
    fmt::print(stderr, "usage: cachematrix_demo [--trace] [--verbose] [--seed N]\n");
}

}  // namespace

int main(int argc, char** argv) {
    using namespace cachematrix;

    HarnessOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--trace") {
            setTraceEnabled(true);
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--seed" && i + 1 < argc) {
            try {
                options.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception& e) {
                fmt::print(stderr, "invalid seed '{}': {}\n", argv[i], e.what());
                return 2;
            }
        } else {
            usage();
            return 2;
        }
    }

    fmt::print("**** Externally cached matrix (computeOrFetchInverse) ****\n");
    const auto external = testExternallyCachedMatrix(options);
    fmt::print("{}\n\n", external);

    fmt::print("**** Self-caching matrix (getInverse) ****\n");
    const auto self = testSelfCachingMatrix(options);
    fmt::print("{}\n", self);

    return external.success() && self.success() ? EXIT_SUCCESS : EXIT_FAILURE;
}
