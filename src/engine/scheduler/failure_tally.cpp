#include "failure_tally.hpp"

namespace Rotor {
namespace Engine {

int FailureTally::record_failure(const std::string& identity) {
    return ++counts_[identity];
}

void FailureTally::reset(const std::string& identity) {
    counts_.erase(identity);
}

int FailureTally::count(const std::string& identity) const {
    auto it = counts_.find(identity);
    return it != counts_.end() ? it->second : 0;
}

}  // namespace Engine
}  // namespace Rotor
