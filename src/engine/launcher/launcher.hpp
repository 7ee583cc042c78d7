#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "../../jobs/job_source.hpp"
#include "../../storage/proxy_store.hpp"
#include "../scheduler/scheduler.hpp"

namespace Rotor {
namespace Engine {

struct LauncherConfig {
    SchedulerConfig           scheduler;
    int                       max_runs = Constants::DEFAULT_MAX_RUNS;  // 0 = unlimited
    std::chrono::milliseconds pass_interval{Constants::DEFAULT_SWEEP_INTERVAL_MS};
};

// Repeats scheduler passes, reloading the proxy store before each one, until
// every job completes, max_runs passes have run, or stop() is called.
class Launcher {
public:
    Launcher(const LauncherConfig&       config,
             Rotor::Storage::ProxyStore& store,
             Rotor::Jobs::JobSource&     jobs,
             WorkFunction                work);

    Launcher(const Launcher&)            = delete;
    Launcher& operator=(const Launcher&) = delete;

    // Returns a process exit code: EXIT_OK, EXIT_INCOMPLETE, EXIT_ERROR or EXIT_SIGNAL.
    int run();

    // Safe from any thread, including a signal watcher.
    void stop();
    bool stop_requested() const;

    int passes() const {
        return passes_;
    }

    const RunReport& last_report() const {
        return report_;
    }

private:
    // Publishes the running scheduler to stop() for the lifetime of one pass.
    class ActiveScheduler;

    LauncherConfig              config_;
    Rotor::Storage::ProxyStore& store_;
    Rotor::Jobs::JobSource&     jobs_;
    WorkFunction                work_;

    int       passes_ = 0;
    RunReport report_;

    std::atomic<bool>       stop_requested_{false};
    std::mutex              mutex_;
    std::condition_variable stop_cv_;
    Scheduler*              current_ = nullptr;

    void wait_between_passes();
};

}  // namespace Engine
}  // namespace Rotor
