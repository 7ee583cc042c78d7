#include "../../../core/logger/logger.hpp"
#include "../scheduler.hpp"

namespace Rotor {
namespace Engine {

void Scheduler::apply_outcome(const ProxyRecord& proxy, Outcome outcome) {
    const std::string id = proxy.identity();

    switch (outcome) {
        case Outcome::Success:
            tally_.reset(id);
            break;

        case Outcome::ConnectionError:
            tally_.reset(id);
            evict(proxy, "connection error");
            break;

        case Outcome::GenericError: {
            if (!pool_.contains(id)) {
                tally_.reset(id);
                break;
            }
            int failures = tally_.record_failure(id);
            if (failures >= config_.max_retries) {
                tally_.reset(id);
                evict(proxy, "after " + std::to_string(failures) + " failures");
            }
            else {
                Logger::warn("Proxy failed (" + std::to_string(failures) + "/"
                             + std::to_string(config_.max_retries) + "): " + id);
            }
            break;
        }
    }
}

void Scheduler::evict(const ProxyRecord& proxy, const std::string& reason) {
    const std::string id = proxy.identity();
    if (!pool_.remove(id))
        return;

    evicted_.push_back(id);
    Logger::warn("Removed proxy " + id + " (" + reason + "), " + std::to_string(pool_.size())
                 + " left");

    if (!pool_.persist())
        Logger::warn("Continuing with in-memory proxy pool");
}

}  // namespace Engine
}  // namespace Rotor
