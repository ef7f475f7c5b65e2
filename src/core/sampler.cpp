#include "sampler.hpp"

#include "logger.hpp"
#include "time_utils.hpp"

namespace lhm {
int run_sampler(const SamplerConfig& cfg, Prober& prober, CancelToken& cancel,
                BoundedChannel<Sample>& out) {
    const auto interval = seconds_to_duration(cfg.interval_s);
    int emitted = 0;
    for (int round = 0; round < cfg.samples; ++round) {
        if (cancel.cancelled()) {
            log(LogLevel::DEBUG, cfg.target + ": cancelled after " + std::to_string(emitted) +
                                     " of " + std::to_string(cfg.samples) + " rounds");
            break;
        }

        ProbeResult res = prober.probe(cfg.target, cfg.packet_size, cfg.timeout_s);
        Sample s;
        s.target = cfg.target;
        s.timestamp = WallClock::now();
        if (res.ok) {
            s.rtt_ms = res.rtt_ms;
        } else {
            log(LogLevel::DEBUG, cfg.target + ": round " + std::to_string(round) + " failed (" +
                                     res.error_category + ")");
        }
        out.push(std::move(s));
        ++emitted;

        // Sleep after every round, failed or not. Wakes early on cancel.
        cancel.wait_for(interval);
    }
    return emitted;
}
}  // namespace lhm
