#pragma once
#include <cstddef>
#include <map>
#include <string>

namespace Rotor {
namespace Engine {

// Consecutive transient failures per proxy identity, scoped to one scheduler run.
class FailureTally {
public:
    int  record_failure(const std::string& identity);
    void reset(const std::string& identity);
    int  count(const std::string& identity) const;

    std::size_t size() const {
        return counts_.size();
    }
    bool empty() const {
        return counts_.empty();
    }

private:
    std::map<std::string, int> counts_;
};

}  // namespace Engine
}  // namespace Rotor
