#include "folder_job_source.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include "../core/logger/logger.hpp"

namespace Rotor {
namespace Jobs {

using namespace Rotor::Core;
using Rotor::Engine::Job;
namespace fs = std::filesystem;

bool FileOutputJobSource::output_exists(const Job& job) const {
    std::error_code ec;
    return fs::is_regular_file(job.output(), ec);
}

FolderJobSource::FolderJobSource(std::string input_dir,
                                 std::string output_dir,
                                 std::string output_ext)
    : input_dir_(std::move(input_dir)),
      output_dir_(std::move(output_dir)),
      output_ext_(std::move(output_ext)) {
}

std::vector<std::shared_ptr<Job>> FolderJobSource::enumerate() {
    if (!fs::is_directory(input_dir_))
        throw std::runtime_error("Input folder not found: " + input_dir_);

    fs::create_directories(output_dir_);

    std::vector<fs::path> inputs;
    for (const auto& entry : fs::directory_iterator(input_dir_)) {
        if (entry.is_regular_file())
            inputs.push_back(entry.path());
    }
    std::sort(inputs.begin(), inputs.end());

    std::vector<std::shared_ptr<Job>> jobs;
    for (const auto& input : inputs) {
        fs::path output = fs::path(output_dir_) / (input.stem().string() + output_ext_);
        jobs.push_back(
            std::make_shared<Job>(input.stem().string(), input.string(), output.string()));
    }

    Logger::info("Found " + std::to_string(jobs.size()) + " job(s) in " + input_dir_);
    return jobs;
}

}  // namespace Jobs
}  // namespace Rotor
