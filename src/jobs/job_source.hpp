#pragma once
#include <memory>
#include <vector>
#include "../engine/job/job.hpp"

namespace Rotor {
namespace Jobs {

class JobSource {
public:
    virtual ~JobSource() = default;

    virtual std::vector<std::shared_ptr<Rotor::Engine::Job>> enumerate() = 0;

    // True when the job's output artifact is already present.
    virtual bool output_exists(const Rotor::Engine::Job& job) const = 0;
};

// Shared by the file-backed sources.
class FileOutputJobSource : public JobSource {
public:
    bool output_exists(const Rotor::Engine::Job& job) const override;
};

}  // namespace Jobs
}  // namespace Rotor
