#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../src/probes/prober.hpp"

// Replays a fixed script of rtts per target; a negative entry is a failed
// round. Targets without a script always succeed with default_rtt.
class FakeProber : public lhm::Prober {
   public:
    explicit FakeProber(double default_rtt = 10.0,
                        std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : default_rtt_(default_rtt), delay_(delay) {}

    void script(const std::string& target, std::vector<double> rtts) {
        std::lock_guard<std::mutex> lock(mu_);
        scripts_[target] = std::move(rtts);
    }

    lhm::ProbeResult probe(const std::string& target, int, double) override {
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        std::lock_guard<std::mutex> lock(mu_);
        size_t round = calls_[target]++;
        lhm::ProbeResult r;
        auto it = scripts_.find(target);
        double v = default_rtt_;
        if (it != scripts_.end() && !it->second.empty())
            v = it->second[round % it->second.size()];
        if (v < 0) {
            r.ok = false;
            r.error_category = "timeout";
        } else {
            r.ok = true;
            r.rtt_ms = v;
        }
        return r;
    }

    size_t calls(const std::string& target) {
        std::lock_guard<std::mutex> lock(mu_);
        return calls_[target];
    }

   private:
    double default_rtt_;
    std::chrono::milliseconds delay_;
    std::mutex mu_;
    std::map<std::string, std::vector<double>> scripts_;
    std::map<std::string, size_t> calls_;
};
