#pragma once
#include <string>
#include <vector>

#include "../core/time_utils.hpp"
#include "aggregator.hpp"

namespace lhm {
constexpr double kDefaultMinLatency = 0.0;
constexpr double kDefaultMaxLatency = 100.0;

struct LatencyCell {
    enum class State { EMPTY, FAILED, MEASURED };
    State state{State::EMPTY};
    double ms{0};
};

struct HeatmapGrid {
    std::vector<std::string> targets;
    std::vector<WallTime> timestamps;
    std::vector<std::vector<LatencyCell>> latency;  // [target][time]
    double min_latency{kDefaultMinLatency};
    double max_latency{kDefaultMaxLatency};
};

// Timeline is the first target's timestamps. Longer series are truncated to
// it and shorter ones leave EMPTY cells. min/max span measured cells > 0 and
// fall back to [0, 100] when there are none.
HeatmapGrid build_heatmap(const std::vector<TargetStatistics>& stats);
}  // namespace lhm
