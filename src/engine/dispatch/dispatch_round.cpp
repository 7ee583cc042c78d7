#include "dispatch_round.hpp"
#include <algorithm>
#include <atomic>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include "../../core/logger/logger.hpp"

namespace Rotor {
namespace Engine {

using namespace Rotor::Core;

namespace {

struct AttemptResult {
    ProxyRecord            proxy;
    std::optional<Outcome> outcome;  // empty when the attempt never started
    std::exception_ptr     error;
};

// Completion-ordered hand-off from worker threads to the dispatching thread.
struct ResultQueue {
    std::mutex                mutex;
    std::condition_variable   cv;
    std::deque<AttemptResult> results;
    std::atomic<bool>         settled{false};

    void push(AttemptResult result) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            results.push_back(std::move(result));
        }
        cv.notify_one();
    }

    AttemptResult pop() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return !results.empty(); });
        AttemptResult result = std::move(results.front());
        results.pop_front();
        return result;
    }
};

}  // namespace

DispatchRound::DispatchRound(const AttemptExecutor& executor, int workers)
    : executor_(executor), workers_(std::max(1, workers)) {
}

RoundReport DispatchRound::run(Job& job, const ProxyPool& pool, const OutcomeHandler& on_outcome) {
    RoundReport report;

    const auto snapshot = pool.snapshot();
    report.proxies      = snapshot.size();
    if (snapshot.empty()) {
        report.status = RoundStatus::NoProxies;
        return report;
    }

    auto               queue = std::make_shared<ResultQueue>();
    std::exception_ptr fatal;

    {
        boost::asio::thread_pool workers(
            std::min<std::size_t>(static_cast<std::size_t>(workers_), snapshot.size()));

        const AttemptExecutor& executor = executor_;
        const std::size_t      cap      = static_cast<std::size_t>(workers_);
        for (std::size_t index = 0; index < snapshot.size(); ++index) {
            const ProxyRecord& proxy = snapshot[index];

            // Attempts beyond the worker cap were never in flight; they are
            // dropped once the job is settled.
            const bool droppable = index >= cap;
            boost::asio::post(workers, [queue, &executor, &job, proxy, droppable]() {
                AttemptResult result{proxy, std::nullopt, nullptr};
                if (!droppable || !queue->settled.load()) {
                    try {
                        result.outcome = executor.run(job, proxy);
                        if (*result.outcome == Outcome::Success)
                            queue->settled = true;
                    } catch (...) {
                        result.error   = std::current_exception();
                        queue->settled = true;
                    }
                }
                queue->push(std::move(result));
            });
        }

        for (std::size_t received = 1; received <= snapshot.size(); ++received) {
            AttemptResult result = queue->pop();

            if (result.error) {
                queue->settled = true;
                if (!fatal)
                    fatal = result.error;
                continue;
            }
            if (!result.outcome) {
                report.skipped++;
                continue;
            }

            report.attempted++;
            Logger::info("Job " + job.name() + " progress, proxy tried: " + std::to_string(received)
                         + "/" + std::to_string(snapshot.size()));

            on_outcome(result.proxy, *result.outcome);

            if (*result.outcome != Outcome::Success)
                continue;

            queue->settled = true;
            if (job.mark_completed()) {
                report.winner = result.proxy.identity();
                Logger::success("Job " + job.name() + " completed with proxy " + report.winner);
            }
        }

        workers.join();
    }

    if (fatal)
        std::rethrow_exception(fatal);

    report.status = job.is_completed() ? RoundStatus::Completed : RoundStatus::Exhausted;
    return report;
}

}  // namespace Engine
}  // namespace Rotor
