#pragma once
#include <optional>
#include <string>

#include "time_utils.hpp"

namespace lhm {
// One round for one target. rtt_ms is empty when the round failed.
struct Sample {
    std::string target;
    WallTime timestamp;
    std::optional<double> rtt_ms;

    bool success() const {
        return rtt_ms.has_value();
    }
};
}  // namespace lhm
