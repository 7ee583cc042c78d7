#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Rotor {
namespace Core {

struct Config {
    std::string input_dir     = Constants::DEFAULT_INPUT_DIR;
    std::string output_dir    = Constants::DEFAULT_OUTPUT_DIR;
    std::string output_ext    = Constants::DEFAULT_OUTPUT_EXT;
    std::string manifest_dir;  // non-empty selects link manifests over input_dir
    std::string proxy_file    = Constants::DEFAULT_PROXY_FILE;
    int         max_proxy_age = Constants::DEFAULT_MAX_PROXY_AGE_S;  // seconds, 0 = no limit
    int         workers       = Constants::DEFAULT_WORKERS;
    int         max_retries   = Constants::DEFAULT_MAX_RETRIES;
    int         sweep_interval  = Constants::DEFAULT_SWEEP_INTERVAL_MS;  // milliseconds
    int         attempt_timeout = Constants::DEFAULT_ATTEMPT_TIMEOUT_S;  // seconds
    int         max_runs        = Constants::DEFAULT_MAX_RUNS;  // 0 = unlimited
    bool        headless        = true;
    std::string log_level       = Constants::DEFAULT_LOG_LEVEL;
    std::string config_path;

    std::vector<std::string> command;

    static Config parse(int argc, char* argv[]);

    // Throws std::invalid_argument describing the first bad value.
    void validate() const;
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Rotor
