#include <chrono>
#include <fstream>
#include <string>

#include "../src/report/result_json.hpp"

using lhm::Sample;
using lhm::WallTime;

static WallTime at(int sec) {
    return WallTime(std::chrono::seconds(1700000000 + sec));  // 2023-11-14T22:13:20Z
}

int main() {
    lhm::RunConfig cfg;
    cfg.targets = {"b.example", "a \"quoted\""};
    cfg.samples = 2;
    cfg.interval_s = 0.5;

    auto stats = lhm::aggregate({
        Sample{"b.example", at(0), 10.0},
        Sample{"a \"quoted\"", at(1), 5.0},
        Sample{"a \"quoted\"", at(0), std::nullopt},
    });
    auto result = lhm::assemble_result(cfg, stats, at(5));
    std::string json = lhm::result_to_json(result);

    auto has = [&json](const std::string& s) { return json.find(s) != std::string::npos; };
    if (json.front() != '{' || json.back() != '}') return 1;
    if (!has("\"targets\":[\"b.example\",\"a \\\"quoted\\\"\"]")) return 2;
    if (!has("\"interval\":0.5,\"samples\":2,\"timeout\":2,\"packetSize\":56")) return 3;
    // Statistics are ordered by name, failed rounds serialize as -1.
    if (json.find("\"target\":\"a \\\"quoted\\\"\"") > json.find("\"target\":\"b.example\""))
        return 4;
    if (!has("\"rtts\":[-1,5]")) return 5;
    if (!has("\"packetLoss\":50")) return 6;
    if (!has("\"rtts\":[10]")) return 7;
    if (!has("\"medianRtt\":10")) return 8;
    if (!has("\"timestamps\":[\"2023-11-14T22:13:20Z\",\"2023-11-14T22:13:21Z\"]")) return 9;
    // b has one round against a two-round reference timeline: its second cell stays 0.
    if (!has("\"latencyData\":[[-1,5],[10,0]]")) return 10;
    if (!has("\"minLatency\":5,\"maxLatency\":10")) return 11;
    if (!has("\"showGraph\":true")) return 12;
    if (!has("\"timestamp\":\"2023-11-14T22:13:25Z\"")) return 13;

    if (lhm::format_number(6.67) != "6.67") return 14;
    if (lhm::format_number(-1) != "-1") return 15;
    if (lhm::format_number(12.345) != "12.345") return 16;
    if (lhm::json_escape("a\nb\x01") != "a\\nb\\u0001") return 17;

    std::string path = "/tmp/lhm_test_result.json";
    if (!lhm::write_result_file(path, result)) return 18;
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    if (line != json) return 19;
    if (lhm::write_result_file("/nonexistent/dir/out.json", result)) return 20;
    return 0;
}
