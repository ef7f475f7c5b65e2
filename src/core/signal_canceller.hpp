#pragma once
#include <signal.h>

#include <atomic>
#include <ctime>
#include <string>
#include <thread>

#include "cancel_token.hpp"
#include "logger.hpp"

namespace lhm {
// Blocks SIGINT/SIGTERM and turns them into a cancel on the token from a
// dedicated thread. Construct it before any sampler thread so the mask is
// inherited. The caller's mask is restored on destruction.
class SignalCanceller {
   public:
    explicit SignalCanceller(CancelToken& cancel) : cancel_(cancel) {
        sigemptyset(&set_);
        sigaddset(&set_, SIGINT);
        sigaddset(&set_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set_, &old_mask_);
        thread_ = std::thread([this]() { watch(); });
    }
    ~SignalCanceller() {
        stop_ = true;
        thread_.join();
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }
    SignalCanceller(const SignalCanceller&) = delete;
    SignalCanceller& operator=(const SignalCanceller&) = delete;

   private:
    void watch() {
        timespec ts{0, 200 * 1000 * 1000};
        while (!stop_) {
            int sig = sigtimedwait(&set_, nullptr, &ts);
            if (sig > 0) {
                log(LogLevel::WARN, std::string("received ") +
                                        (sig == SIGINT ? "SIGINT" : "SIGTERM") +
                                        "; stopping after current rounds");
                cancel_.cancel();
                return;
            }
        }
    }

    CancelToken& cancel_;
    sigset_t set_;
    sigset_t old_mask_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};
}  // namespace lhm
