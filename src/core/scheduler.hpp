#pragma once
#include <functional>
#include <thread>
#include <vector>

#include "../probes/prober.hpp"
#include "cancel_token.hpp"
#include "config.hpp"
#include "sample.hpp"

namespace lhm {
// Fans out one sampler thread per target and collects every Sample they
// emit. The caller may pass its own token to cancel from outside (signal
// handler, another thread); cfg.deadline_s > 0 cancels it automatically.
class Scheduler {
   public:
    Scheduler(Prober& prober, CancelToken& cancel);
    virtual ~Scheduler() = default;

    // Blocks until every sampler has finished or stopped on cancellation.
    // Order of the returned samples is unspecified. If a sampler thread
    // cannot be started the run is cancelled and the samples of the
    // samplers already running are returned.
    std::vector<Sample> run(const RunConfig& cfg);

   protected:
    // Starts one sampler thread. May throw std::system_error.
    virtual std::thread spawn(std::function<void()> body);

   private:
    Prober& prober_;
    CancelToken& cancel_;
};
}  // namespace lhm
