#include "aggregator.hpp"

#include <algorithm>
#include <map>

#include "../util/percentile.hpp"
#include "../util/rounding.hpp"

namespace lhm {
size_t TargetStatistics::successes() const {
    size_t n = 0;
    for (const auto& r : rtts)
        if (r) ++n;
    return n;
}

TargetStatistics compute_target_statistics(const std::string& target,
                                           const std::vector<Sample>& ordered) {
    TargetStatistics st;
    st.target = target;
    st.rtts.reserve(ordered.size());
    st.timestamps.reserve(ordered.size());

    std::vector<double> ok;
    for (const auto& s : ordered) {
        st.timestamps.push_back(s.timestamp);
        st.rtts.push_back(s.rtt_ms);
        if (s.success()) ok.push_back(*s.rtt_ms);
    }

    if (!ok.empty()) {
        auto mm = std::minmax_element(ok.begin(), ok.end());
        st.min_rtt = round_half_up(*mm.first);
        st.max_rtt = round_half_up(*mm.second);
        st.avg_rtt = round_half_up(mean(ok));
        st.median_rtt = round_half_up(median(ok));
        st.jitter = round_half_up(mean_abs_deviation(ok));
    }
    if (!ordered.empty()) {
        double failed = static_cast<double>(ordered.size() - ok.size());
        st.packet_loss_pct = round_half_up(failed / ordered.size() * 100.0);
    }
    return st;
}

std::vector<TargetStatistics> aggregate(std::vector<Sample> samples) {
    // std::map keeps the groups in lexicographic target order.
    std::map<std::string, std::vector<Sample>> by_target;
    for (auto& s : samples) {
        std::string key = s.target;
        by_target[key].push_back(std::move(s));
    }

    std::vector<TargetStatistics> out;
    out.reserve(by_target.size());
    for (auto& kv : by_target) {
        auto& group = kv.second;
        std::stable_sort(group.begin(), group.end(), [](const Sample& a, const Sample& b) {
            return a.timestamp < b.timestamp;
        });
        out.push_back(compute_target_statistics(kv.first, group));
    }
    return out;
}
}  // namespace lhm
