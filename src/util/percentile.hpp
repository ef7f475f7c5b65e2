#pragma once
#include <algorithm>
#include <vector>

namespace lhm {
// Linear interpolation between closest ranks. percentile(v, 50) is the usual
// median: the middle value, or the mean of the two middle values.
inline double percentile(std::vector<double> v, double p) {
    if (v.empty()) return 0.0;
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * (v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(lo + 1, v.size() - 1);
    double frac = rank - lo;
    return v[lo] + (v[hi] - v[lo]) * frac;
}

inline double median(const std::vector<double>& v) {
    return percentile(v, 50);
}

inline double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double sum = 0;
    for (double x : v) sum += x;
    return sum / v.size();
}

// Mean absolute deviation from the mean.
inline double mean_abs_deviation(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double avg = mean(v);
    double dev = 0;
    for (double x : v) dev += x > avg ? x - avg : avg - x;
    return dev / v.size();
}
}  // namespace lhm
