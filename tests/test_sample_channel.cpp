#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "../src/core/sample_channel.hpp"

int main() {
    using namespace std::chrono;
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 250;

    // Capacity far below the total so producers must block on a full buffer.
    lhm::BoundedChannel<int> ch(8, kProducers);
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&ch, p]() {
            for (int i = 0; i < kPerProducer; ++i) ch.push(p * kPerProducer + i);
            ch.done();
        });
    }
    std::vector<int> seen(kProducers * kPerProducer, 0);
    int count = 0;
    while (auto v = ch.pop()) {
        ++seen[*v];
        ++count;
    }
    for (auto& t : producers) t.join();
    if (count != kProducers * kPerProducer) return 1;
    for (int s : seen)
        if (s != 1) return 2;
    if (!ch.closed()) return 3;
    if (ch.pop()) return 4;

    // pop_until reports a timeout while a producer is still open.
    lhm::BoundedChannel<int> slow(4, 1);
    bool timed_out = false;
    auto r = slow.pop_until(steady_clock::now() + milliseconds(20), timed_out);
    if (r || !timed_out) return 5;
    slow.push(7);
    r = slow.pop_until(steady_clock::now() + milliseconds(20), timed_out);
    if (!r || *r != 7 || timed_out) return 6;
    slow.done();
    r = slow.pop_until(steady_clock::now() + milliseconds(20), timed_out);
    if (r || timed_out) return 7;
    return 0;
}
