#include "trace.hpp"

#include <cstdio>

#include "fmt/core.h"

namespace cachematrix {

static bool trace_enabled = false;

void setTraceEnabled(bool enabled) {
    trace_enabled = enabled;
}

bool traceEnabled() {
    return trace_enabled;
}

void traceComputingInverse(std::ptrdiff_t rows, std::ptrdiff_t cols) {
    if (!trace_enabled) {
        return;
    }
    fmt::print(stderr, "computing inverse ({} x {})\n", rows, cols);
}

}  // namespace cachematrix
