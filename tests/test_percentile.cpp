#include <cmath>
#include <vector>

#include "../src/util/percentile.hpp"
#include "../src/util/rounding.hpp"

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

int main() {
    using namespace lhm;
    std::vector<double> v{10, 20, 30, 40, 50};
    if (percentile(v, 50) != 30) return 1;
    if (percentile(v, 0) != 10) return 2;
    if (percentile(v, 100) != 50) return 3;

    if (median({10, 20, 30}) != 20) return 4;
    if (median({10, 20}) != 15) return 5;
    if (median({30, 10, 20}) != 20) return 6;
    if (median({}) != 0) return 7;

    if (mean({10, 20, 30}) != 20) return 8;
    if (!near(mean_abs_deviation({10, 20, 30}), 20.0 / 3.0)) return 9;
    if (mean_abs_deviation({}) != 0) return 10;
    if (mean_abs_deviation({5, 5, 5}) != 0) return 11;

    if (!near(round_half_up(20.0 / 3.0), 6.67)) return 12;
    if (!near(round_half_up(1.125, 2), 1.13)) return 13;
    if (!near(round_half_up(33.333333), 33.33)) return 14;
    if (round_half_up(0.0) != 0.0) return 15;
    if (!near(round_half_up(12.3456, 1), 12.3)) return 16;
    return 0;
}
