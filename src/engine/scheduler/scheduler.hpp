#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../jobs/job_source.hpp"
#include "../../proxy/pool/proxy_pool.hpp"
#include "../attempt/attempt_executor.hpp"
#include "../dispatch/dispatch_round.hpp"
#include "../job/job.hpp"
#include "failure_tally.hpp"

namespace Rotor {
namespace Engine {

using namespace Rotor::Core;
using Rotor::Proxy::Pool::ProxyPool;

struct SchedulerConfig {
    int                       workers     = Constants::DEFAULT_WORKERS;
    int                       max_retries = Constants::DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds sweep_interval{Constants::DEFAULT_SWEEP_INTERVAL_MS};
    bool                      headless = true;
};

enum class StopReason { AllCompleted, ProxyPoolExhausted, Aborted };

std::string to_string(StopReason reason);

struct RunReport {
    bool                     all_completed = false;
    StopReason               reason        = StopReason::AllCompleted;
    std::vector<std::string> incomplete;
    std::size_t              completed_count = 0;
    std::vector<std::string> evicted;
};

// Drives every pending job to completion over a depleting proxy pool.
// Pool, tally and persistence are only touched from the thread calling run().
class Scheduler {
public:
    Scheduler(const SchedulerConfig&  config,
              ProxyPool&              pool,
              Rotor::Jobs::JobSource& source,
              WorkFunction            work);

    Scheduler(const Scheduler&)            = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Unclassified exceptions from the work function propagate out of run().
    RunReport run();

    // Safe from any thread; the current round drains before the loop exits.
    void stop();
    bool stop_requested() const;

    const FailureTally& tally() const {
        return tally_;
    }

    const std::vector<std::shared_ptr<Job>>& jobs() const {
        return jobs_;
    }

private:
    SchedulerConfig         config_;
    ProxyPool&              pool_;
    Rotor::Jobs::JobSource& source_;
    AttemptExecutor         executor_;
    DispatchRound           round_;
    FailureTally            tally_;

    std::vector<std::shared_ptr<Job>> jobs_;
    std::vector<std::string>          evicted_;

    std::atomic<bool>       stop_requested_{false};
    std::mutex              stop_mutex_;
    std::condition_variable stop_cv_;

    std::vector<std::shared_ptr<Job>> collect_incomplete();
    void      sweep(std::vector<std::shared_ptr<Job>>& incomplete);
    void      wait_for_next_sweep();
    RunReport make_report(StopReason reason) const;

    void apply_outcome(const ProxyRecord& proxy, Outcome outcome);
    void evict(const ProxyRecord& proxy, const std::string& reason);
};

}  // namespace Engine
}  // namespace Rotor
