#include "config.hpp"

#include <cctype>
#include <stdexcept>
#include <unordered_set>

#include "logger.hpp"

namespace lhm {
namespace {
std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string format_seconds(double s) {
    return std::to_string(static_cast<long long>(s));
}

bool to_double(const std::string& flag, const std::string& v, double& out, std::string& err) {
    try {
        size_t used = 0;
        out = std::stod(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return true;
    } catch (const std::exception&) {
        err = flag + " expects a number, got '" + v + "'";
        return false;
    }
}

bool to_int(const std::string& flag, const std::string& v, int& out, std::string& err) {
    try {
        size_t used = 0;
        out = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return true;
    } catch (const std::exception&) {
        err = flag + " expects an integer, got '" + v + "'";
        return false;
    }
}
}  // namespace

std::vector<std::string> split_targets(const std::string& csv) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t comma = csv.find(',', start);
        if (comma == std::string::npos) comma = csv.size();
        std::string host = trim(csv.substr(start, comma - start));
        if (!host.empty()) {
            if (seen.insert(host).second)
                out.push_back(host);
            else
                log(LogLevel::WARN, "duplicate target ignored: " + host);
        }
        start = comma + 1;
    }
    return out;
}

bool validate_config(const RunConfig& cfg, std::string& err) {
    if (cfg.targets.empty()) {
        err = "target hosts parameter is required";
        return false;
    }
    for (const auto& t : cfg.targets) {
        if (t.empty()) {
            err = "target host must not be empty";
            return false;
        }
    }
    if (!(cfg.interval_s > 0) || cfg.interval_s > kMaxIntervalSeconds) {
        err = "interval must be in (0, " + format_seconds(kMaxIntervalSeconds) + "] seconds";
        return false;
    }
    if (cfg.samples <= 0) {
        err = "samples must be > 0";
        return false;
    }
    if (!(cfg.timeout_s > 0) || cfg.timeout_s > kMaxTimeoutSeconds) {
        err = "timeout must be in (0, " + format_seconds(kMaxTimeoutSeconds) + "] seconds";
        return false;
    }
    if (cfg.packet_size <= 0 || cfg.packet_size > kMaxPacketSize) {
        err = "packet size must be in 1.." + std::to_string(kMaxPacketSize);
        return false;
    }
    if (!(cfg.deadline_s >= 0) || cfg.deadline_s > kMaxDeadlineSeconds) {
        err = "deadline must be in [0, " + format_seconds(kMaxDeadlineSeconds) + "] seconds";
        return false;
    }
    return true;
}

bool parse_run_args(int argc, char** argv, int first, CliOptions& out, std::string& err) {
    for (int i = first; i < argc; ++i) {
        std::string a = argv[i];
        bool has_value = i + 1 < argc;
        if (a == "--no-graph") {
            out.run.show_graph = false;
            continue;
        }
        if (a != "--targets" && a != "--interval" && a != "--samples" && a != "--timeout" &&
            a != "--packet-size" && a != "--deadline" && a != "--out" && a != "--log-level") {
            err = "unknown option: " + a;
            return false;
        }
        if (!has_value) {
            err = a + " requires a value";
            return false;
        }
        std::string v = argv[++i];
        if (a == "--targets") {
            out.run.targets = split_targets(v);
        } else if (a == "--interval") {
            if (!to_double(a, v, out.run.interval_s, err)) return false;
        } else if (a == "--samples") {
            if (!to_int(a, v, out.run.samples, err)) return false;
        } else if (a == "--timeout") {
            if (!to_double(a, v, out.run.timeout_s, err)) return false;
        } else if (a == "--packet-size") {
            if (!to_int(a, v, out.run.packet_size, err)) return false;
        } else if (a == "--deadline") {
            if (!to_double(a, v, out.run.deadline_s, err)) return false;
        } else if (a == "--out") {
            out.out_path = v;
        } else {
            out.log_level = v;
        }
    }
    return true;
}
}  // namespace lhm
