#include <cstdlib>
#include <iostream>

#include "core/cancel_token.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/signal_canceller.hpp"
#include "probes/icmp_prober.hpp"
#include "report/result.hpp"
#include "report/result_json.hpp"

using namespace lhm;

static int cmd_doctor() {
    std::cout << "Doctor checks:\n";
    IcmpSocketKind kind = IcmpProber::detect();
    switch (kind) {
        case IcmpSocketKind::RAW:
            std::cout << " - ICMP raw: available\n";
            break;
        case IcmpSocketKind::DGRAM:
            std::cout << " - ICMP raw: unavailable (need CAP_NET_RAW or root)\n"
                      << " - ICMP datagram: available\n";
            break;
        case IcmpSocketKind::NONE:
            std::cout << " - ICMP raw: unavailable (need CAP_NET_RAW or root)\n"
                      << " - ICMP datagram: unavailable (check net.ipv4.ping_group_range)\n";
            break;
    }
    std::cout << " - For CAP_NET_RAW: try setcap cap_net_raw+ep ./lhm\n";
    return kind == IcmpSocketKind::NONE ? 1 : 0;
}

static int cmd_run(const CliOptions& opts) {
    if (!opts.log_level.empty()) {
        LogLevel lvl;
        if (!parse_log_level(opts.log_level, lvl)) {
            std::cerr << "unknown log level: " << opts.log_level << "\n";
            return 2;
        }
        set_log_level(lvl);
    }

    std::string err;
    CancelToken cancel;
    IcmpProber prober;
    RunResult result;
    {
        SignalCanceller signals(cancel);
        // Configuration errors are logged by run_latency_heatmap.
        if (!run_latency_heatmap(opts.run, prober, cancel, result, err)) return 1;
    }
    if (result.cancelled) log(LogLevel::WARN, "run cancelled; result is partial");

    if (opts.out_path.empty()) {
        write_result_json(std::cout, result);
        std::cout << "\n";
        return std::cout ? 0 : 1;
    }
    if (!write_result_file(opts.out_path, result)) return 1;
    log(LogLevel::INFO, "result written to " + opts.out_path);
    return 0;
}

static void print_usage() {
    std::cerr << "Usage: lhm <run|doctor> [options]\n"
              << "  run    --targets <host[,host...]> [--interval <sec>] [--samples <n>]\n"
                 "         [--timeout <sec>] [--packet-size <bytes>] [--no-graph]\n"
                 "         [--deadline <sec>] [--out <result.json>] [--log-level <level>]\n"
              << "  doctor (no args)\n"
              << "Environment: LHM_LOG_LEVEL=debug|info|warn|error\n";
}

int main(int argc, char** argv) {
    if (const char* env = std::getenv("LHM_LOG_LEVEL")) {
        LogLevel lvl;
        if (parse_log_level(env, lvl)) set_log_level(lvl);
    }
    if (argc < 2) {
        print_usage();
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }
    if (cmd == "doctor") return cmd_doctor();
    if (cmd == "run") {
        CliOptions opts;
        std::string err;
        if (!parse_run_args(argc, argv, 2, opts, err)) {
            std::cerr << err << "\n";
            print_usage();
            return 2;
        }
        return cmd_run(opts);
    }
    std::cerr << "Unknown command\n";
    print_usage();
    return 2;
}
