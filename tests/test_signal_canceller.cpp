#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include "../src/core/cancel_token.hpp"
#include "../src/core/logger.hpp"
#include "../src/core/signal_canceller.hpp"

static bool blocked(int sig) {
    sigset_t cur;
    sigemptyset(&cur);
    pthread_sigmask(SIG_BLOCK, nullptr, &cur);
    return sigismember(&cur, sig) == 1;
}

int main() {
    using namespace std::chrono;
    lhm::set_log_level(lhm::LogLevel::ERROR);

    if (blocked(SIGINT) || blocked(SIGTERM)) return 1;

    // Blocked only while a run is in progress.
    {
        lhm::CancelToken cancel;
        {
            lhm::SignalCanceller signals(cancel);
            if (!blocked(SIGINT) || !blocked(SIGTERM)) return 2;
        }
        if (blocked(SIGINT) || blocked(SIGTERM)) return 3;
        if (cancel.cancelled()) return 4;
    }

    // SIGTERM during a run cancels the token instead of killing the process,
    // and the caller's mask comes back afterwards.
    {
        lhm::CancelToken cancel;
        {
            lhm::SignalCanceller signals(cancel);
            ::kill(::getpid(), SIGTERM);
            if (!cancel.wait_for(seconds(2))) return 5;
        }
        if (blocked(SIGINT) || blocked(SIGTERM)) return 6;
    }

    // A mask the caller already had is left in place.
    {
        sigset_t term;
        sigemptyset(&term);
        sigaddset(&term, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &term, nullptr);
        lhm::CancelToken cancel;
        { lhm::SignalCanceller signals(cancel); }
        if (!blocked(SIGTERM) || blocked(SIGINT)) return 7;
        pthread_sigmask(SIG_UNBLOCK, &term, nullptr);
    }
    return 0;
}
