#pragma once
#include <string>
#include <vector>

namespace lhm {
constexpr int kMaxPacketSize = 65507;
constexpr double kMaxIntervalSeconds = 86400;
constexpr double kMaxTimeoutSeconds = 86400;
constexpr double kMaxDeadlineSeconds = 30 * 86400;

struct RunConfig {
    std::vector<std::string> targets;
    double interval_s{1.0};
    int samples{30};
    double timeout_s{2.0};
    int packet_size{56};
    bool show_graph{true};
    double deadline_s{0.0};  // 0 = no deadline
};

// CLI-only settings that never reach the sampling core.
struct CliOptions {
    RunConfig run;
    std::string out_path;  // empty = stdout
    std::string log_level;
};

// Splits "a, b,c" into trimmed hosts. Empty entries and repeats are dropped.
std::vector<std::string> split_targets(const std::string& csv);

bool validate_config(const RunConfig& cfg, std::string& err);

// Parses `run` options starting at argv[first]. Does not validate ranges.
bool parse_run_args(int argc, char** argv, int first, CliOptions& out, std::string& err);
}  // namespace lhm
