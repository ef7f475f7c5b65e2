#pragma once
#include <string>

#include "../probes/prober.hpp"
#include "cancel_token.hpp"
#include "sample.hpp"
#include "sample_channel.hpp"

namespace lhm {
struct SamplerConfig {
    std::string target;
    int samples{0};
    double interval_s{0};
    double timeout_s{0};
    int packet_size{0};
};

// Runs one target's rounds on the calling thread, pushing one Sample per
// round into out. Stops early, without error, once cancel is triggered.
// Returns the number of samples emitted. Does not call out.done().
int run_sampler(const SamplerConfig& cfg, Prober& prober, CancelToken& cancel,
                BoundedChannel<Sample>& out);
}  // namespace lhm
