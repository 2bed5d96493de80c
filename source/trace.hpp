#pragma once

#include <cstddef>

namespace cachematrix {

// Diagnostic output for inverse (re)computation, disabled by default
void setTraceEnabled(bool enabled);
bool traceEnabled();

// Prints "computing inverse (R x C)" to stderr when tracing is enabled
void traceComputingInverse(std::ptrdiff_t rows, std::ptrdiff_t cols);

}  // namespace cachematrix
