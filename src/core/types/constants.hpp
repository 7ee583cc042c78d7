#pragma once
#include <cstddef>

namespace Rotor {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_WORKERS           = 8;
    static constexpr int         DEFAULT_MAX_RETRIES       = 3;
    static constexpr int         DEFAULT_SWEEP_INTERVAL_MS = 2000;
    static constexpr int         DEFAULT_ATTEMPT_TIMEOUT_S = 600;
    static constexpr int         DEFAULT_MAX_PROXY_AGE_S   = 1800;
    static constexpr int         DEFAULT_MAX_RUNS          = 0;  // 0 = until every job completes
    static constexpr const char* DEFAULT_INPUT_DIR         = "splitted";
    static constexpr const char* DEFAULT_OUTPUT_DIR        = "html";
    static constexpr const char* DEFAULT_OUTPUT_EXT        = ".html";
    static constexpr const char* DEFAULT_PROXY_FILE        = "proxies.json";
    static constexpr const char* DEFAULT_LOG_LEVEL         = "info";

    static constexpr std::size_t MAX_JOB_NAME_LENGTH = 120;

    // Exit codes understood by CommandWorker
    static constexpr int EXIT_CONNECTION_ERROR = 2;
    static constexpr int EXIT_EXEC_FAILED      = 127;

    // Process exit codes
    static constexpr int EXIT_OK         = 0;
    static constexpr int EXIT_INCOMPLETE = 1;
    static constexpr int EXIT_ERROR      = 2;
    static constexpr int EXIT_SIGNAL     = 130;
};

}  // namespace Core
}  // namespace Rotor
