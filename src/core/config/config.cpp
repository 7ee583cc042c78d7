#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Rotor {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["input"])
            config.input_dir = yaml["input"].as<std::string>();
        if (yaml["input_dir"])
            config.input_dir = yaml["input_dir"].as<std::string>();
        if (yaml["output"])
            config.output_dir = yaml["output"].as<std::string>();
        if (yaml["output_dir"])
            config.output_dir = yaml["output_dir"].as<std::string>();
        if (yaml["output_ext"])
            config.output_ext = yaml["output_ext"].as<std::string>();
        if (yaml["manifest"])
            config.manifest_dir = yaml["manifest"].as<std::string>();
        if (yaml["manifest_dir"])
            config.manifest_dir = yaml["manifest_dir"].as<std::string>();
        if (yaml["proxy_file"])
            config.proxy_file = yaml["proxy_file"].as<std::string>();
        if (yaml["max_proxy_age"])
            config.max_proxy_age = yaml["max_proxy_age"].as<int>();
        if (yaml["workers"])
            config.workers = yaml["workers"].as<int>();
        if (yaml["max_retries"])
            config.max_retries = yaml["max_retries"].as<int>();
        if (yaml["proxy_retries"])
            config.max_retries = yaml["proxy_retries"].as<int>();
        if (yaml["sweep_interval"])
            config.sweep_interval = yaml["sweep_interval"].as<int>();
        if (yaml["attempt_timeout"])
            config.attempt_timeout = yaml["attempt_timeout"].as<int>();
        if (yaml["max_runs"])
            config.max_runs = yaml["max_runs"].as<int>();
        if (yaml["headless"])
            config.headless = yaml["headless"].as<bool>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();

        if (yaml["command"]) {
            if (!yaml["command"].IsSequence())
                throw std::runtime_error("Error parsing config file: 'command' must be a list");
            config.command.clear();
            for (const auto& node : yaml["command"])
                config.command.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Rotor - proxy-rotated concurrent upload runner"};

    app.add_option("-i,--input", config.input_dir, "Folder of input chunks, one job per file");
    app.add_option("-o,--output", config.output_dir, "Folder receiving output artifacts");
    app.add_option("--output-ext", config.output_ext, "Extension of output artifacts");
    app.add_option("--manifest", config.manifest_dir, "Folder of JSON link manifests");
    app.add_option("-P,--proxy-file", config.proxy_file, "JSON proxy store");
    app.add_option("--max-proxy-age", config.max_proxy_age, "Skip proxies older than N seconds");
    app.add_option("-w,--workers", config.workers, "Concurrent attempts per job");
    app.add_option("--max-retries", config.max_retries, "Failures before removing a proxy");
    app.add_option("--sweep-interval", config.sweep_interval, "Pause between sweeps (ms)");
    app.add_option("--timeout", config.attempt_timeout, "Timeout per attempt (seconds)");
    app.add_option("--max-runs", config.max_runs, "Launcher passes, reloading proxies (0 = until done)");
    app.add_option("-l,--log-level", config.log_level, "Minimum log level")
        ->check(CLI::IsMember({"debug", "info", "warning", "error", "critical"}));
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_flag(
        "--no-headless",
        [&](size_t count) {
            if (count > 0)
                config.headless = false;
        },
        "Ask the uploader for an interactive session");

    app.add_option("command", config.command, "Uploader command, after --");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    return config;
}

void Config::validate() const {
    if (workers < 1)
        throw std::invalid_argument("workers must be at least 1");
    if (max_retries < 1)
        throw std::invalid_argument("max retries must be at least 1");
    if (sweep_interval < 0)
        throw std::invalid_argument("sweep interval must not be negative");
    if (attempt_timeout < 1)
        throw std::invalid_argument("attempt timeout must be at least 1 second");
    if (max_runs < 0)
        throw std::invalid_argument("max runs must not be negative");
    if (max_proxy_age < 0)
        throw std::invalid_argument("max proxy age must not be negative");
    if (command.empty())
        throw std::invalid_argument("no uploader command given (append it after --)");
}

}  // namespace Core
}  // namespace Rotor
