#include "scheduler.hpp"

#include <chrono>
#include <system_error>

#include "logger.hpp"
#include "sample_channel.hpp"
#include "sampler.hpp"
#include "time_utils.hpp"

namespace lhm {
namespace {
constexpr size_t kMaxChannelCapacity = 4096;
}

Scheduler::Scheduler(Prober& prober, CancelToken& cancel) : prober_(prober), cancel_(cancel) {}

std::thread Scheduler::spawn(std::function<void()> body) {
    return std::thread(std::move(body));
}

std::vector<Sample> Scheduler::run(const RunConfig& cfg) {
    const size_t expected = cfg.targets.size() * static_cast<size_t>(cfg.samples);
    size_t capacity = expected < kMaxChannelCapacity ? expected : kMaxChannelCapacity;
    BoundedChannel<Sample> channel(capacity, cfg.targets.size());

    log(LogLevel::INFO, "sampling " + std::to_string(cfg.targets.size()) + " target(s), " +
                            std::to_string(cfg.samples) + " rounds each");

    std::vector<std::thread> workers;
    workers.reserve(cfg.targets.size());
    try {
        for (const auto& target : cfg.targets) {
            SamplerConfig sc{target, cfg.samples, cfg.interval_s, cfg.timeout_s,
                             cfg.packet_size};
            workers.push_back(spawn([this, sc, &channel]() {
                int n = run_sampler(sc, prober_, cancel_, channel);
                log(LogLevel::DEBUG, sc.target + ": sampler finished with " +
                                         std::to_string(n) + " sample(s)");
                channel.done();
            }));
        }
    } catch (const std::system_error& e) {
        log(LogLevel::ERROR, "cannot start sampler " + std::to_string(workers.size() + 1) +
                                 " of " + std::to_string(cfg.targets.size()) + ": " + e.what() +
                                 "; cancelling run");
        cancel_.cancel();
        // Stand in for the samplers that never started.
        for (size_t i = workers.size(); i < cfg.targets.size(); ++i) channel.done();
    }

    std::vector<Sample> collected;
    collected.reserve(expected);
    const bool has_deadline = cfg.deadline_s > 0;
    const auto deadline = std::chrono::steady_clock::now() + seconds_to_duration(cfg.deadline_s);
    while (true) {
        std::optional<Sample> s;
        if (has_deadline && !cancel_.cancelled()) {
            bool timed_out = false;
            s = channel.pop_until(deadline, timed_out);
            if (timed_out) {
                log(LogLevel::WARN, "deadline reached; cancelling remaining rounds");
                cancel_.cancel();
                continue;
            }
        } else {
            s = channel.pop();
        }
        if (!s) break;
        collected.push_back(std::move(*s));
    }

    for (auto& w : workers) w.join();

    if (collected.size() < expected) {
        log(LogLevel::WARN, "collected " + std::to_string(collected.size()) + " of " +
                                std::to_string(expected) + " samples");
    } else {
        log(LogLevel::INFO, "collected " + std::to_string(collected.size()) + " samples");
    }
    return collected;
}
}  // namespace lhm
