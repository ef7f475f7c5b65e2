#include "result_json.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "../core/logger.hpp"

namespace lhm {
namespace {
constexpr double kFailedRtt = -1.0;
constexpr double kEmptyCell = 0.0;

double cell_value(const LatencyCell& c) {
    switch (c.state) {
        case LatencyCell::State::MEASURED: return c.ms;
        case LatencyCell::State::FAILED: return kFailedRtt;
        case LatencyCell::State::EMPTY: return kEmptyCell;
    }
    return kEmptyCell;
}

template <class T, class F>
void write_array(std::ostream& out, const std::vector<T>& v, F each) {
    out << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out << ",";
        each(v[i]);
    }
    out << "]";
}

void write_string(std::ostream& out, const std::string& s) {
    out << "\"" << json_escape(s) << "\"";
}

void write_statistics(std::ostream& out, const TargetStatistics& st) {
    out << "{\"target\":";
    write_string(out, st.target);
    out << ",\"minRtt\":" << format_number(st.min_rtt);
    out << ",\"avgRtt\":" << format_number(st.avg_rtt);
    out << ",\"maxRtt\":" << format_number(st.max_rtt);
    out << ",\"medianRtt\":" << format_number(st.median_rtt);
    out << ",\"jitter\":" << format_number(st.jitter);
    out << ",\"packetLoss\":" << format_number(st.packet_loss_pct);
    out << ",\"rtts\":";
    write_array(out, st.rtts, [&](const std::optional<double>& r) {
        out << format_number(r ? *r : kFailedRtt);
    });
    out << ",\"timestamps\":";
    write_array(out, st.timestamps, [&](WallTime t) { write_string(out, format_rfc3339(t)); });
    out << "}";
}

void write_heatmap(std::ostream& out, const HeatmapGrid& g) {
    out << "{\"targets\":";
    write_array(out, g.targets, [&](const std::string& t) { write_string(out, t); });
    out << ",\"timestamps\":";
    write_array(out, g.timestamps, [&](WallTime t) { write_string(out, format_rfc3339(t)); });
    out << ",\"latencyData\":";
    write_array(out, g.latency, [&](const std::vector<LatencyCell>& row) {
        write_array(out, row, [&](const LatencyCell& c) { out << format_number(cell_value(c)); });
    });
    out << ",\"minLatency\":" << format_number(g.min_latency);
    out << ",\"maxLatency\":" << format_number(g.max_latency);
    out << "}";
}
}  // namespace

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// Integral values print without a fraction ("2", "-1"); others keep up to
// 15 significant digits so 6.67 stays "6.67".
std::string format_number(double v) {
    if (!std::isfinite(v)) return "0";
    if (v == std::floor(v) && std::fabs(v) < 1e15) {
        return std::to_string(static_cast<long long>(v));
    }
    std::ostringstream oss;
    oss << std::setprecision(15) << v;
    return oss.str();
}

void write_result_json(std::ostream& out, const RunResult& r) {
    const RunConfig& c = r.config;
    out << "{\"targets\":";
    write_array(out, c.targets, [&](const std::string& t) { write_string(out, t); });
    out << ",\"interval\":" << format_number(c.interval_s);
    out << ",\"samples\":" << c.samples;
    out << ",\"timeout\":" << format_number(c.timeout_s);
    out << ",\"packetSize\":" << c.packet_size;
    out << ",\"statistics\":";
    write_array(out, r.statistics, [&](const TargetStatistics& st) { write_statistics(out, st); });
    out << ",\"heatmapData\":";
    write_heatmap(out, r.heatmap);
    out << ",\"showGraph\":" << (c.show_graph ? "true" : "false");
    out << ",\"timestamp\":";
    write_string(out, format_rfc3339(r.completed_at));
    out << "}";
}

std::string result_to_json(const RunResult& r) {
    std::ostringstream oss;
    write_result_json(oss, r);
    return oss.str();
}

bool write_result_file(const std::string& path, const RunResult& r) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        log(LogLevel::ERROR, "cannot open output file: " + path);
        return false;
    }
    write_result_json(out, r);
    out << "\n";
    out.flush();
    if (!out) {
        log(LogLevel::ERROR, "failed writing output file: " + path);
        return false;
    }
    return true;
}
}  // namespace lhm
