#include "json_proxy_store.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unordered_set>
#include "../core/logger/logger.hpp"

namespace Rotor {
namespace Storage {

using namespace Rotor::Core;
using Rotor::Proxy::Pool::ProxyRecord;

namespace {

int parse_port(const nlohmann::json& value) {
    if (value.is_number_integer())
        return value.get<int>();
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        size_t      consumed = 0;
        int         port     = std::stoi(s, &consumed);
        if (consumed != s.size())
            throw std::invalid_argument("trailing characters in port '" + s + "'");
        return port;
    }
    throw std::invalid_argument("port must be a number or numeric string");
}

}  // namespace

JsonProxyStore::JsonProxyStore(const std::string& path, std::chrono::seconds max_age)
    : path_(path), max_age_(max_age) {
}

ProxyRecord JsonProxyStore::from_json(const nlohmann::json& entry) {
    if (!entry.is_object() || !entry.contains("ip") || !entry.contains("port"))
        throw std::runtime_error("Proxy entry requires 'ip' and 'port': " + entry.dump());

    ProxyRecord record;
    try {
        record.host = entry.at("ip").get<std::string>();
        record.port = parse_port(entry.at("port"));
        if (entry.contains("last_checked") && entry.at("last_checked").is_number())
            record.last_checked = entry.at("last_checked").get<std::int64_t>();
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid proxy entry " + entry.dump() + ": " + e.what());
    }

    record.attributes = entry;
    record.attributes.erase("ip");
    record.attributes.erase("port");
    record.attributes.erase("last_checked");
    return record;
}

nlohmann::json JsonProxyStore::to_json(const ProxyRecord& record) {
    nlohmann::json entry = record.attributes.is_object() ? record.attributes
                                                         : nlohmann::json::object();
    entry["ip"]   = record.host;
    entry["port"] = record.port;
    if (record.last_checked > 0)
        entry["last_checked"] = record.last_checked;
    return entry;
}

bool JsonProxyStore::is_fresh(const ProxyRecord& record, std::int64_t now) const {
    if (max_age_.count() <= 0 || record.last_checked <= 0)
        return true;
    return now - record.last_checked <= max_age_.count();
}

std::vector<ProxyRecord> JsonProxyStore::load() {
    std::vector<ProxyRecord> proxies;

    if (!std::filesystem::exists(path_)) {
        Logger::warn("Proxy file not found: " + path_);
        return proxies;
    }

    std::ifstream file(path_);
    if (!file.is_open())
        throw std::runtime_error("Cannot open proxy file: " + path_);

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path_ + ": " + e.what());
    }

    if (!root.is_array())
        throw std::runtime_error("Proxy file must contain a JSON array: " + path_);

    const std::int64_t              now   = static_cast<std::int64_t>(std::time(nullptr));
    size_t                          stale = 0;
    std::unordered_set<std::string> seen;

    for (const auto& entry : root) {
        ProxyRecord record = from_json(entry);
        if (!is_fresh(record, now)) {
            stale++;
            continue;
        }
        if (!seen.insert(record.identity()).second)
            continue;
        proxies.push_back(std::move(record));
    }

    Logger::info("Loaded " + std::to_string(proxies.size()) + " proxies from " + path_
                 + (stale ? " (" + std::to_string(stale) + " stale skipped)" : ""));
    return proxies;
}

bool JsonProxyStore::save(const std::vector<ProxyRecord>& proxies) {
    nlohmann::json root = nlohmann::json::array();
    for (const auto& p : proxies)
        root.push_back(to_json(p));

    try {
        std::filesystem::path target(path_);
        if (target.has_parent_path())
            std::filesystem::create_directories(target.parent_path());

        std::filesystem::path tmp = target;
        tmp += ".tmp";

        {
            std::ofstream file(tmp, std::ios::out | std::ios::trunc);
            if (!file.is_open()) {
                Logger::error("Write Error: " + tmp.string());
                return false;
            }
            file << root.dump(4);
            file.flush();
            if (!file) {
                Logger::error("Write Error: " + tmp.string());
                return false;
            }
        }

        std::filesystem::rename(tmp, target);
    } catch (const std::exception& e) {
        Logger::error("FS Error: " + std::string(e.what()));
        return false;
    }
    return true;
}

}  // namespace Storage
}  // namespace Rotor
