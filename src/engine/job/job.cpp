#include "job.hpp"
#include <utility>

namespace Rotor {
namespace Engine {

Job::Job(std::string name, std::string input, std::string output)
    : name_(std::move(name)), input_(std::move(input)), output_(std::move(output)) {
}

bool Job::is_incomplete() const {
    return !completed_.load();
}

bool Job::is_completed() const {
    return completed_.load();
}

bool Job::in_flight() const {
    return in_flight_.load();
}

bool Job::try_acquire() {
    bool expected = false;
    return in_flight_.compare_exchange_strong(expected, true);
}

void Job::release() {
    in_flight_.store(false);
}

bool Job::mark_completed() {
    return !completed_.exchange(true);
}

}  // namespace Engine
}  // namespace Rotor
