#pragma once
#include <cmath>

namespace lhm {
// Round half up to `decimals` places. Inputs here are latencies and
// percentages, never negative.
inline double round_half_up(double x, int decimals = 2) {
    double factor = 1.0;
    for (int i = 0; i < decimals; ++i) factor *= 10.0;
    return std::floor(x * factor + 0.5) / factor;
}
}  // namespace lhm
