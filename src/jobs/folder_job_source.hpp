#pragma once
#include <string>
#include "job_source.hpp"

namespace Rotor {
namespace Jobs {

// One job per regular file in input_dir, in file name order.
// Output artifact: output_dir/<stem><output_ext>.
class FolderJobSource : public FileOutputJobSource {
public:
    FolderJobSource(std::string input_dir, std::string output_dir, std::string output_ext);

    std::vector<std::shared_ptr<Rotor::Engine::Job>> enumerate() override;

private:
    std::string input_dir_;
    std::string output_dir_;
    std::string output_ext_;
};

}  // namespace Jobs
}  // namespace Rotor
