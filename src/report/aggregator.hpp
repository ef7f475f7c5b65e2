#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../core/sample.hpp"

namespace lhm {
struct TargetStatistics {
    std::string target;
    double min_rtt{0}, avg_rtt{0}, max_rtt{0}, median_rtt{0};
    double jitter{0};
    double packet_loss_pct{0};
    // One entry per collected round, in time order. Empty rtt = failed round.
    std::vector<std::optional<double>> rtts;
    std::vector<WallTime> timestamps;

    size_t successes() const;
};

// Groups by target, orders each group by timestamp and reduces it.
// Result is sorted by target name.
std::vector<TargetStatistics> aggregate(std::vector<Sample> samples);

// Reduction for one target's rounds, already in time order.
TargetStatistics compute_target_statistics(const std::string& target,
                                           const std::vector<Sample>& ordered);
}  // namespace lhm
