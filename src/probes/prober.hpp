#pragma once
#include <string>

namespace lhm {
struct ProbeResult {
    bool ok{false};
    double rtt_ms{0};
    std::string error_category;  // empty when ok
};

// One latency measurement against one host. Implementations must be safe to
// call from several sampler threads at once and must return within roughly
// timeout_s. Network conditions are reported through ProbeResult, not thrown.
class Prober {
   public:
    virtual ~Prober() = default;
    virtual ProbeResult probe(const std::string& target, int packet_size, double timeout_s) = 0;
};
}  // namespace lhm
