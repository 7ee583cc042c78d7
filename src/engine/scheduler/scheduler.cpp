#include "scheduler.hpp"
#include <exception>
#include <utility>
#include "../../core/logger/logger.hpp"

namespace Rotor {
namespace Engine {

std::string to_string(StopReason reason) {
    switch (reason) {
        case StopReason::AllCompleted:
            return "all jobs completed";
        case StopReason::ProxyPoolExhausted:
            return "proxy pool exhausted";
        case StopReason::Aborted:
            return "aborted";
    }
    return "unknown";
}

Scheduler::Scheduler(const SchedulerConfig&  config,
                     ProxyPool&              pool,
                     Rotor::Jobs::JobSource& source,
                     WorkFunction            work)
    : config_(config),
      pool_(pool),
      source_(source),
      executor_(std::move(work), config.headless),
      round_(executor_, config.workers) {
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

bool Scheduler::stop_requested() const {
    return stop_requested_.load();
}

RunReport Scheduler::run() {
    tally_ = FailureTally{};
    evicted_.clear();

    auto incomplete = collect_incomplete();
    if (incomplete.empty()) {
        Logger::success("All jobs already completed (" + std::to_string(jobs_.size()) + ")");
        return make_report(StopReason::AllCompleted);
    }

    Logger::info(std::to_string(incomplete.size()) + "/" + std::to_string(jobs_.size())
                 + " job(s) pending, " + std::to_string(pool_.size()) + " proxies available");

    try {
        while (!incomplete.empty() && !pool_.empty() && !stop_requested()) {
            sweep(incomplete);

            if (incomplete.empty() || pool_.empty() || stop_requested())
                break;
            wait_for_next_sweep();
        }
    } catch (const std::exception& e) {
        Logger::error("Run aborted: " + std::string(e.what()));
        for (const auto& job : incomplete)
            Logger::error("Incomplete: " + job->name());
        throw;
    }

    StopReason reason = StopReason::AllCompleted;
    if (!incomplete.empty())
        reason = stop_requested() ? StopReason::Aborted : StopReason::ProxyPoolExhausted;

    RunReport report = make_report(reason);
    if (report.all_completed) {
        Logger::success("All jobs completed successfully");
    }
    else {
        Logger::warn("Run stopped: " + to_string(reason) + ", "
                     + std::to_string(report.incomplete.size()) + " job(s) incomplete");
        for (const auto& name : report.incomplete)
            Logger::warn("Incomplete: " + name);
    }
    return report;
}

std::vector<std::shared_ptr<Job>> Scheduler::collect_incomplete() {
    jobs_ = source_.enumerate();

    std::vector<std::shared_ptr<Job>> incomplete;
    for (const auto& job : jobs_) {
        if (source_.output_exists(*job)) {
            job->mark_completed();
            Logger::debug("Output present, skipping: " + job->name());
            continue;
        }
        incomplete.push_back(job);
    }
    return incomplete;
}

void Scheduler::sweep(std::vector<std::shared_ptr<Job>>& incomplete) {
    for (auto it = incomplete.begin(); it != incomplete.end();) {
        if (stop_requested() || pool_.empty())
            return;

        Job&     job = **it;
        JobLease lease(job);
        if (!lease) {
            Logger::debug("Job in flight, skipping: " + job.name());
            ++it;
            continue;
        }

        Logger::info("Processing job: " + job.name());
        RoundReport round = round_.run(
            job, pool_, [this](const ProxyRecord& proxy, Outcome outcome) {
                apply_outcome(proxy, outcome);
            });

        if (job.is_completed()) {
            it = incomplete.erase(it);
            continue;
        }

        if (round.status == RoundStatus::NoProxies)
            Logger::warn("No proxies left for job: " + job.name());
        else
            Logger::error("Upload failed for job " + job.name() + " ("
                          + std::to_string(round.attempted) + " proxies tried)");
        ++it;
    }
}

void Scheduler::wait_for_next_sweep() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait_for(lock, config_.sweep_interval, [this] { return stop_requested_.load(); });
}

RunReport Scheduler::make_report(StopReason reason) const {
    RunReport report;
    report.reason  = reason;
    report.evicted = evicted_;
    for (const auto& job : jobs_) {
        if (job->is_completed())
            report.completed_count++;
        else
            report.incomplete.push_back(job->name());
    }
    report.all_completed = report.incomplete.empty();
    return report;
}

}  // namespace Engine
}  // namespace Rotor
