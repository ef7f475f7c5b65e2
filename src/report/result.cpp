#include "result.hpp"

#include "../core/logger.hpp"
#include "../core/scheduler.hpp"

namespace lhm {
RunResult assemble_result(const RunConfig& cfg, std::vector<TargetStatistics> stats,
                          WallTime completed_at) {
    RunResult r;
    r.config = cfg;
    r.heatmap = build_heatmap(stats);
    r.statistics = std::move(stats);
    r.completed_at = completed_at;
    return r;
}

bool run_latency_heatmap(const RunConfig& cfg, Prober& prober, CancelToken& cancel,
                         RunResult& out, std::string& err) {
    if (!validate_config(cfg, err)) {
        log(LogLevel::ERROR, "invalid configuration: " + err);
        return false;
    }
    Scheduler scheduler(prober, cancel);
    auto samples = scheduler.run(cfg);
    auto stats = aggregate(std::move(samples));
    for (const auto& st : stats) {
        log(LogLevel::DEBUG, st.target + ": avg " + std::to_string(st.avg_rtt) + " ms, loss " +
                                 std::to_string(st.packet_loss_pct) + "%");
    }
    out = assemble_result(cfg, std::move(stats), WallClock::now());
    out.cancelled = cancel.cancelled();
    return true;
}
}  // namespace lhm
