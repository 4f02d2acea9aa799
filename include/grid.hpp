#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// n evenly spaced values from start to end inclusive; n == 1 gives {start}.
// Both endpoints are reproduced exactly.
inline std::vector<double> linspace(double start, double end, int n) {
    if (n < 1) {
        throw std::invalid_argument("linspace: count must be >= 1, got " + std::to_string(n));
    }
    std::vector<double> values(static_cast<size_t>(n));
    if (n == 1) {
        values[0] = start;
        return values;
    }
    const double step = (end - start) / static_cast<double>(n - 1);
    for (int i = 0; i < n; ++i) {
        values[static_cast<size_t>(i)] = start + step * static_cast<double>(i);
    }
    values.back() = end;
    return values;
}
