#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace lhm {
// Bounded multi-producer / single-consumer queue. The consumer sees the
// channel as closed once every registered producer has called done() and
// the buffer is empty.
template <class T>
class BoundedChannel {
   public:
    BoundedChannel(size_t capacity, size_t producers)
        : capacity_(capacity == 0 ? 1 : capacity), producers_left_(producers) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Blocks while the buffer is full.
    void push(T item) {
        std::unique_lock<std::mutex> lock(mu_);
        not_full_.wait(lock, [this] { return buf_.size() < capacity_; });
        buf_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
    }

    // Termination signal from one producer.
    void done() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (producers_left_ > 0) --producers_left_;
        }
        not_empty_.notify_all();
    }

    // Blocks until an item arrives or the channel closes (nullopt).
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mu_);
        not_empty_.wait(lock, [this] { return !buf_.empty() || producers_left_ == 0; });
        return take(lock);
    }

    // Like pop() but gives up at deadline. timed_out is set when it did.
    template <class Clock, class Duration>
    std::optional<T> pop_until(const std::chrono::time_point<Clock, Duration>& deadline,
                               bool& timed_out) {
        std::unique_lock<std::mutex> lock(mu_);
        timed_out = !not_empty_.wait_until(
            lock, deadline, [this] { return !buf_.empty() || producers_left_ == 0; });
        if (timed_out) return std::nullopt;
        return take(lock);
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return producers_left_ == 0 && buf_.empty();
    }

   private:
    std::optional<T> take(std::unique_lock<std::mutex>& lock) {
        if (buf_.empty()) return std::nullopt;
        T item = std::move(buf_.front());
        buf_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    mutable std::mutex mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> buf_;
    size_t capacity_;
    size_t producers_left_;
};
}  // namespace lhm
