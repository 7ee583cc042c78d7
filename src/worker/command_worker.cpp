#include "command_worker.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <signal.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../core/types/errors.hpp"
#include "../utils/text/string_utils.hpp"

namespace Rotor {
namespace Worker {

using namespace Rotor::Core;
using Rotor::Utils::Text::replace_all;

namespace {
constexpr int CHILD_POLL_INTERVAL_MS = 50;
}  // namespace

CommandWorker::CommandWorker(std::vector<std::string> argv_template,
                             std::chrono::milliseconds timeout)
    : argv_template_(std::move(argv_template)), timeout_(timeout) {
    if (argv_template_.empty())
        throw std::invalid_argument("CommandWorker requires a command");
}

std::vector<std::string>
CommandWorker::expand(const Job& job, const ProxyRecord& proxy, bool headless) const {
    std::vector<std::string> args;
    args.reserve(argv_template_.size());
    for (std::string arg : argv_template_) {
        arg = replace_all(arg, "{input}", job.input());
        arg = replace_all(arg, "{output}", job.output());
        arg = replace_all(arg, "{name}", job.name());
        arg = replace_all(arg, "{proxy}", proxy.identity());
        arg = replace_all(arg, "{host}", proxy.host);
        arg = replace_all(arg, "{port}", std::to_string(proxy.port));
        arg = replace_all(arg, "{headless}", headless ? "1" : "0");
        args.push_back(std::move(arg));
    }
    return args;
}

Outcome CommandWorker::operator()(const Job& job, const ProxyRecord& proxy, bool headless) const {
    const std::vector<std::string> arg_strings = expand(job, proxy, headless);

    std::vector<char*> args;
    for (const auto& s : arg_strings)
        args.push_back(const_cast<char*>(s.c_str()));
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
        throw AttemptError("fork failed: " + std::string(std::strerror(errno)));

    if (pid == 0) {
        // Own process group: a terminal SIGINT stops the launcher, not the
        // uploader, so the running round drains with real outcomes.
        setpgid(0, 0);

        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execvp(args[0], args.data());
        _exit(Constants::EXIT_EXEC_FAILED);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    int        status   = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid)
            break;
        if (r < 0) {
            if (errno == EINTR)
                continue;
            throw AttemptError("waitpid failed: " + std::string(std::strerror(errno)));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(-pid, SIGKILL);
            waitpid(pid, &status, 0);
            Logger::warn("Attempt timed out: " + job.name() + " [" + proxy.identity() + "]");
            return Outcome::ConnectionError;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(CHILD_POLL_INTERVAL_MS));
    }

    if (!WIFEXITED(status)) {
        Logger::debug("Uploader killed by signal: " + job.name());
        return Outcome::GenericError;
    }

    const int code = WEXITSTATUS(status);
    if (code == 0) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(job.output(), ec))
            return Outcome::Success;
        Logger::debug("Uploader exited cleanly without output: " + job.output());
        return Outcome::GenericError;
    }
    if (code == Constants::EXIT_CONNECTION_ERROR)
        return Outcome::ConnectionError;
    if (code == Constants::EXIT_EXEC_FAILED)
        throw FatalError("Cannot execute uploader: " + arg_strings.front());
    return Outcome::GenericError;
}

}  // namespace Worker
}  // namespace Rotor
