#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/launcher/launcher.hpp"
#include "jobs/folder_job_source.hpp"
#include "jobs/manifest_job_source.hpp"
#include "storage/json_proxy_store.hpp"
#include "worker/command_worker.hpp"

namespace {

using namespace Rotor::Core;
using namespace Rotor::Engine;

// Forwards SIGINT/SIGTERM to the launcher from a dedicated io_context thread.
class SignalWatcher {
public:
    explicit SignalWatcher(Launcher& launcher)
        : launcher_(launcher), signals_(ioc_, SIGINT, SIGTERM) {
        signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
            if (error)
                return;
            Logger::warn("Signal " + std::to_string(signal_number)
                         + " received. Finishing current round...");
            launcher_.stop();
        });
        thread_ = std::thread([this]() { ioc_.run(); });
    }

    ~SignalWatcher() {
        ioc_.stop();
        if (thread_.joinable())
            thread_.join();
    }

    SignalWatcher(const SignalWatcher&)            = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    Launcher&               launcher_;
    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_;
    std::thread             thread_;
};

std::unique_ptr<Rotor::Jobs::JobSource> make_job_source(const Config& config) {
    if (!config.manifest_dir.empty()) {
        return std::make_unique<Rotor::Jobs::ManifestJobSource>(config.manifest_dir,
                                                                config.output_dir);
    }
    return std::make_unique<Rotor::Jobs::FolderJobSource>(
        config.input_dir, config.output_dir, config.output_ext);
}

int run_launcher(const Config& config) {
    Rotor::Storage::JsonProxyStore store(config.proxy_file,
                                         std::chrono::seconds(config.max_proxy_age));
    auto jobs = make_job_source(config);

    LauncherConfig launcher_config;
    launcher_config.scheduler.workers        = config.workers;
    launcher_config.scheduler.max_retries    = config.max_retries;
    launcher_config.scheduler.sweep_interval = std::chrono::milliseconds(config.sweep_interval);
    launcher_config.scheduler.headless       = config.headless;
    launcher_config.max_runs                 = config.max_runs;
    launcher_config.pass_interval            = std::chrono::milliseconds(config.sweep_interval);

    Rotor::Worker::CommandWorker worker(config.command,
                                        std::chrono::seconds(config.attempt_timeout));

    Launcher      launcher(launcher_config, store, *jobs, worker);
    SignalWatcher signals(launcher);
    return launcher.run();
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Config config = Config::parse(argc, argv);
        Logger::set_level(Logger::level_from_name(config.log_level));
        config.validate();
        return run_launcher(config);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return Constants::EXIT_ERROR;
    }
}
