#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace lhm {
// Broadcast cancellation shared by every worker of one invocation.
class CancelToken {
   public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mu_);
        return cancelled_;
    }

    // Sleeps for d or until cancel(); returns true if cancelled.
    template <class Rep, class Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& d) {
        std::unique_lock<std::mutex> lock(mu_);
        return cv_.wait_for(lock, d, [this] { return cancelled_; });
    }

   private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool cancelled_{false};
};
}  // namespace lhm
