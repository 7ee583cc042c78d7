#pragma once
#include <functional>

#include "../../proxy/pool/proxy_record.hpp"
#include "../job/job.hpp"
#include "../job/outcome.hpp"

namespace Rotor {
namespace Engine {

using Rotor::Proxy::Pool::ProxyRecord;

// Performs one attempt of `job` routed through `proxy`. Must return; enforcing
// a timeout is the implementation's responsibility.
using WorkFunction = std::function<Outcome(const Job&, const ProxyRecord&, bool headless)>;

class AttemptExecutor {
public:
    AttemptExecutor(WorkFunction work, bool headless);

    // ConnectionError and AttemptError are folded into an Outcome; anything
    // else escapes to the caller.
    Outcome run(const Job& job, const ProxyRecord& proxy) const;

private:
    WorkFunction work_;
    bool         headless_;
};

}  // namespace Engine
}  // namespace Rotor
