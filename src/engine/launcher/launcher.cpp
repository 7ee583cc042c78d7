#include "launcher.hpp"
#include <exception>
#include <string>
#include <utility>
#include "../../core/logger/logger.hpp"

namespace Rotor {
namespace Engine {

using Rotor::Proxy::Pool::ProxyPool;

class Launcher::ActiveScheduler {
public:
    ActiveScheduler(Launcher& launcher, Scheduler& scheduler) : launcher_(launcher) {
        std::lock_guard<std::mutex> lock(launcher_.mutex_);
        launcher_.current_ = &scheduler;
        if (launcher_.stop_requested_)
            scheduler.stop();
    }

    ~ActiveScheduler() {
        std::lock_guard<std::mutex> lock(launcher_.mutex_);
        launcher_.current_ = nullptr;
    }

    ActiveScheduler(const ActiveScheduler&)            = delete;
    ActiveScheduler& operator=(const ActiveScheduler&) = delete;

private:
    Launcher& launcher_;
};

Launcher::Launcher(const LauncherConfig&       config,
                   Rotor::Storage::ProxyStore& store,
                   Rotor::Jobs::JobSource&     jobs,
                   WorkFunction                work)
    : config_(config), store_(store), jobs_(jobs), work_(std::move(work)) {
}

void Launcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        if (current_)
            current_->stop();
    }
    stop_cv_.notify_all();
}

bool Launcher::stop_requested() const {
    return stop_requested_.load();
}

int Launcher::run() {
    passes_ = 0;
    report_ = RunReport{};

    const std::string limit =
        config_.max_runs > 0 ? std::to_string(config_.max_runs) : std::string("unlimited");

    while (!stop_requested() && (config_.max_runs == 0 || passes_ < config_.max_runs)) {
        if (passes_ > 0)
            wait_between_passes();
        if (stop_requested())
            break;

        passes_++;
        Logger::info("Launcher pass " + std::to_string(passes_) + "/" + limit);

        try {
            ProxyPool pool(store_.load(), store_);
            Scheduler scheduler(config_.scheduler, pool, jobs_, work_);

            ActiveScheduler active(*this, scheduler);
            report_ = scheduler.run();
        } catch (const std::exception& e) {
            Logger::error("Launcher stopped: " + std::string(e.what()));
            return Constants::EXIT_ERROR;
        }

        if (report_.all_completed)
            return Constants::EXIT_OK;
        if (report_.reason == StopReason::Aborted)
            break;
    }

    if (stop_requested())
        return Constants::EXIT_SIGNAL;
    return Constants::EXIT_INCOMPLETE;
}

void Launcher::wait_between_passes() {
    std::unique_lock<std::mutex> lock(mutex_);
    stop_cv_.wait_for(lock, config_.pass_interval, [this] { return stop_requested_.load(); });
}

}  // namespace Engine
}  // namespace Rotor
