#include "attempt_executor.hpp"
#include <stdexcept>
#include <utility>
#include "../../core/logger/logger.hpp"
#include "../../core/types/errors.hpp"

namespace Rotor {
namespace Engine {

using namespace Rotor::Core;

AttemptExecutor::AttemptExecutor(WorkFunction work, bool headless)
    : work_(std::move(work)), headless_(headless) {
    if (!work_)
        throw std::invalid_argument("AttemptExecutor requires a work function");
}

Outcome AttemptExecutor::run(const Job& job, const ProxyRecord& proxy) const {
    try {
        Outcome outcome = work_(job, proxy, headless_);
        Logger::debug("Attempt " + job.name() + " [" + proxy.identity() + "] -> "
                      + to_string(outcome));
        return outcome;
    } catch (const Rotor::Core::ConnectionError& e) {
        Logger::debug("Attempt " + job.name() + " [" + proxy.identity()
                      + "] connection error: " + e.what());
        return Outcome::ConnectionError;
    } catch (const AttemptError& e) {
        Logger::debug("Attempt " + job.name() + " [" + proxy.identity() + "] failed: " + e.what());
        return Outcome::GenericError;
    }
}

}  // namespace Engine
}  // namespace Rotor
