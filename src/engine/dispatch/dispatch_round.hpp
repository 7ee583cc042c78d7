#pragma once
#include <cstddef>
#include <functional>
#include <string>

#include "../../proxy/pool/proxy_pool.hpp"
#include "../attempt/attempt_executor.hpp"
#include "../job/job.hpp"
#include "../job/outcome.hpp"

namespace Rotor {
namespace Engine {

using Rotor::Proxy::Pool::ProxyPool;

enum class RoundStatus { Completed, Exhausted, NoProxies };

struct RoundReport {
    RoundStatus status    = RoundStatus::Exhausted;
    std::size_t proxies   = 0;  // snapshot size
    std::size_t attempted = 0;  // attempts that reached the work function
    std::size_t skipped   = 0;  // queued attempts dropped once the job was settled
    std::string winner;         // identity of the proxy that completed the job
};

// Called on the dispatching thread, once per attempt, in completion order.
using OutcomeHandler = std::function<void(const ProxyRecord&, Outcome)>;

// Fans one job out across every proxy of a pool snapshot on a bounded worker pool.
class DispatchRound {
public:
    DispatchRound(const AttemptExecutor& executor, int workers);

    // The caller holds the job's guard. An unclassified exception from any
    // attempt is rethrown after the running attempts have drained.
    RoundReport run(Job& job, const ProxyPool& pool, const OutcomeHandler& on_outcome);

private:
    const AttemptExecutor& executor_;
    int                    workers_;
};

}  // namespace Engine
}  // namespace Rotor
