#pragma once
#include <string>
#include <vector>

#include "../core/cancel_token.hpp"
#include "../core/config.hpp"
#include "../core/time_utils.hpp"
#include "../probes/prober.hpp"
#include "aggregator.hpp"
#include "heatmap.hpp"

namespace lhm {
struct RunResult {
    RunConfig config;
    std::vector<TargetStatistics> statistics;
    HeatmapGrid heatmap;
    WallTime completed_at;
    bool cancelled{false};
};

RunResult assemble_result(const RunConfig& cfg, std::vector<TargetStatistics> stats,
                          WallTime completed_at);

// Validates cfg, samples every target and reduces the samples. Returns false
// with err set only for configuration errors; probe failures and
// cancellation still yield a result.
bool run_latency_heatmap(const RunConfig& cfg, Prober& prober, CancelToken& cancel,
                         RunResult& out, std::string& err);
}  // namespace lhm
