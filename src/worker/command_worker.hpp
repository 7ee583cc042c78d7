#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "../engine/attempt/attempt_executor.hpp"

namespace Rotor {
namespace Worker {

using Rotor::Engine::Job;
using Rotor::Engine::Outcome;
using Rotor::Proxy::Pool::ProxyRecord;

// Work function that runs an external uploader once per attempt.
//
// Placeholders substituted in every argument:
//   {input} {output} {name} {proxy} {host} {port} {headless}
//
// Exit status mapping:
//   0   -> Success if the output artifact exists, GenericError otherwise
//   2   -> ConnectionError
//   127 -> FatalError (command could not be executed)
//   any other status, or death by signal -> GenericError
// The uploader runs in its own process group, so terminal signals aimed at
// the launcher do not reach it. A run exceeding the timeout has its whole
// group killed and is reported as ConnectionError.
class CommandWorker {
public:
    CommandWorker(std::vector<std::string> argv_template, std::chrono::milliseconds timeout);

    Outcome operator()(const Job& job, const ProxyRecord& proxy, bool headless) const;

    std::vector<std::string> expand(const Job& job, const ProxyRecord& proxy, bool headless) const;

private:
    std::vector<std::string>  argv_template_;
    std::chrono::milliseconds timeout_;
};

}  // namespace Worker
}  // namespace Rotor
