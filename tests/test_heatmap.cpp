#include <chrono>
#include <vector>

#include "../src/report/heatmap.hpp"

using lhm::LatencyCell;
using lhm::TargetStatistics;
using lhm::WallTime;

static TargetStatistics series(const std::string& name, std::vector<std::optional<double>> rtts) {
    TargetStatistics st;
    st.target = name;
    st.rtts = rtts;
    for (size_t i = 0; i < rtts.size(); ++i)
        st.timestamps.push_back(WallTime(std::chrono::seconds(1700000000 + i)));
    return st;
}

int main() {
    std::vector<TargetStatistics> stats{
        series("a", {5.0, std::nullopt, 15.0}),
        series("b", {1.0, 2.0}),                  // shorter: last cell stays empty
        series("c", {40.0, 0.0, 8.0, 99.0}),      // longer: truncated to 3
    };
    auto grid = lhm::build_heatmap(stats);
    if (grid.targets.size() != 3 || grid.timestamps.size() != 3) return 1;
    if (grid.latency.size() != 3) return 2;
    for (const auto& row : grid.latency)
        if (row.size() != 3) return 3;
    if (grid.timestamps != stats[0].timestamps) return 4;

    if (grid.latency[0][1].state != LatencyCell::State::FAILED) return 5;
    if (grid.latency[0][2].state != LatencyCell::State::MEASURED || grid.latency[0][2].ms != 15)
        return 6;
    if (grid.latency[1][2].state != LatencyCell::State::EMPTY) return 7;
    if (grid.latency[2][1].state != LatencyCell::State::MEASURED || grid.latency[2][1].ms != 0)
        return 8;

    // 99 was truncated away and 0 does not count toward the range.
    if (grid.min_latency != 1.0 || grid.max_latency != 40.0) return 9;

    // Nothing strictly positive: fixed display range.
    auto dead = lhm::build_heatmap({series("a", {std::nullopt, std::nullopt}), series("b", {0.0})});
    if (dead.min_latency != 0 || dead.max_latency != 100) return 10;
    if (dead.latency.size() != 2 || dead.latency[1].size() != 2) return 11;

    auto empty = lhm::build_heatmap({});
    if (!empty.targets.empty() || !empty.timestamps.empty() || !empty.latency.empty()) return 12;
    if (empty.min_latency != 0 || empty.max_latency != 100) return 13;
    return 0;
}
