#include "heatmap.hpp"

namespace lhm {
HeatmapGrid build_heatmap(const std::vector<TargetStatistics>& stats) {
    HeatmapGrid grid;
    grid.targets.reserve(stats.size());
    for (const auto& st : stats) grid.targets.push_back(st.target);
    if (!stats.empty()) grid.timestamps = stats.front().timestamps;

    const size_t cols = grid.timestamps.size();
    grid.latency.assign(stats.size(), std::vector<LatencyCell>(cols));

    bool any = false;
    double lo = 0, hi = 0;
    for (size_t i = 0; i < stats.size(); ++i) {
        const auto& rtts = stats[i].rtts;
        for (size_t j = 0; j < rtts.size() && j < cols; ++j) {
            LatencyCell& cell = grid.latency[i][j];
            if (!rtts[j]) {
                cell.state = LatencyCell::State::FAILED;
                continue;
            }
            cell.state = LatencyCell::State::MEASURED;
            cell.ms = *rtts[j];
            if (cell.ms <= 0) continue;
            if (!any || cell.ms < lo) lo = cell.ms;
            if (!any || cell.ms > hi) hi = cell.ms;
            any = true;
        }
    }
    if (any) {
        grid.min_latency = lo;
        grid.max_latency = hi;
    }
    return grid;
}
}  // namespace lhm
