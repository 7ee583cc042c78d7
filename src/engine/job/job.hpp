#pragma once
#include <atomic>
#include <string>

namespace Rotor {
namespace Engine {

// One unit of work. `completed` only ever goes false -> true; the in-flight
// guard is the only state worker threads are allowed to touch.
class Job {
public:
    Job(std::string name, std::string input, std::string output);

    Job(const Job&)            = delete;
    Job& operator=(const Job&) = delete;

    const std::string& name() const {
        return name_;
    }
    const std::string& input() const {
        return input_;
    }
    const std::string& output() const {
        return output_;
    }

    bool is_incomplete() const;
    bool is_completed() const;
    bool in_flight() const;

    bool try_acquire();
    void release();

    // True only for the call that performed the transition.
    bool mark_completed();

private:
    std::string       name_;
    std::string       input_;
    std::string       output_;
    std::atomic<bool> completed_{false};
    std::atomic<bool> in_flight_{false};
};

// Holds a job's guard for the lifetime of a round.
class JobLease {
public:
    explicit JobLease(Job& job) : job_(job), held_(job.try_acquire()) {
    }
    ~JobLease() {
        if (held_)
            job_.release();
    }

    JobLease(const JobLease&)            = delete;
    JobLease& operator=(const JobLease&) = delete;

    explicit operator bool() const {
        return held_;
    }

private:
    Job& job_;
    bool held_;
};

}  // namespace Engine
}  // namespace Rotor
