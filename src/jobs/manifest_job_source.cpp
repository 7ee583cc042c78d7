#include "manifest_job_source.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <map>
#include <sstream>
#include <stdexcept>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../utils/text/string_utils.hpp"

namespace Rotor {
namespace Jobs {

using namespace Rotor::Core;
using Rotor::Engine::Job;
namespace fs = std::filesystem;

namespace {

std::string as_text(const nlohmann::ordered_json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

std::string read_manifest(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw std::runtime_error("Cannot open manifest: " + path.string());

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();

    // UTF-8 byte order mark
    if (Rotor::Utils::Text::starts_with(text, "\xEF\xBB\xBF"))
        text.erase(0, 3);
    return Rotor::Utils::Text::trim(text);
}

}  // namespace

ManifestJobSource::ManifestJobSource(std::string manifest_dir, std::string output_dir)
    : manifest_dir_(std::move(manifest_dir)), output_dir_(std::move(output_dir)) {
}

std::vector<std::shared_ptr<Job>> ManifestJobSource::enumerate() {
    std::vector<fs::path> manifests;
    if (fs::is_directory(manifest_dir_)) {
        for (const auto& entry : fs::directory_iterator(manifest_dir_)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json")
                manifests.push_back(entry.path());
        }
    }
    if (manifests.empty())
        throw std::runtime_error("No json found in " + manifest_dir_);
    std::sort(manifests.begin(), manifests.end());

    fs::create_directories(output_dir_);
    Logger::info("Loading " + std::to_string(manifests.size()) + " manifest file(s)");

    std::vector<std::shared_ptr<Job>> jobs;
    std::map<std::string, fs::path>   name_to_source;

    for (const auto& path : manifests) {
        Logger::debug("Reading links: " + path.string());

        std::string text = read_manifest(path);
        if (text.empty())
            throw std::runtime_error("Manifest is empty: " + path.string());

        nlohmann::ordered_json data;
        try {
            data = nlohmann::ordered_json::parse(text);
        } catch (const nlohmann::ordered_json::parse_error& e) {
            throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
        }

        auto add_job = [&](const std::string& raw_name, const std::string& url) {
            std::string name =
                Rotor::Utils::Text::sanitize_name(raw_name, Constants::MAX_JOB_NAME_LENGTH);

            auto it = name_to_source.find(name);
            if (it != name_to_source.end()) {
                throw std::runtime_error("Duplicate job name '" + name + "' found in:\n - "
                                         + it->second.string() + "\n - " + path.string());
            }
            name_to_source.emplace(name, path);

            fs::path output = fs::path(output_dir_) / (name + ".json");
            jobs.push_back(std::make_shared<Job>(name, url, output.string()));
        };

        if (data.is_object()) {
            for (auto it = data.begin(); it != data.end(); ++it)
                add_job(it.key(), as_text(it.value()));
        }
        else if (data.is_array()) {
            for (const auto& item : data) {
                if (item.is_object() && item.contains("name") && item.contains("url")) {
                    add_job(as_text(item["name"]), as_text(item["url"]));
                }
                else if (item.is_array() && item.size() >= 2) {
                    add_job(as_text(item[0]), as_text(item[1]));
                }
                else {
                    throw std::runtime_error("Unsupported item in " + path.string() + ": "
                                             + item.dump());
                }
            }
        }
        else {
            throw std::runtime_error("Unsupported json format in " + path.string());
        }
    }

    Logger::info("Loaded " + std::to_string(jobs.size()) + " link job(s)");
    return jobs;
}

}  // namespace Jobs
}  // namespace Rotor
