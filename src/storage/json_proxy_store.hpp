#pragma once
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include "proxy_store.hpp"

namespace Rotor {
namespace Storage {

// JSON array of {"ip": ..., "port": ..., "last_checked": ...} objects.
// Records older than max_age are dropped on load; a zero max_age keeps everything.
class JsonProxyStore : public ProxyStore {
public:
    JsonProxyStore(const std::string& path, std::chrono::seconds max_age);
    ~JsonProxyStore() override = default;

    std::vector<Rotor::Proxy::Pool::ProxyRecord> load() override;
    bool save(const std::vector<Rotor::Proxy::Pool::ProxyRecord>& proxies) override;

    const std::string& path() const {
        return path_;
    }

    static Rotor::Proxy::Pool::ProxyRecord from_json(const nlohmann::json& entry);
    static nlohmann::json                  to_json(const Rotor::Proxy::Pool::ProxyRecord& record);

private:
    bool is_fresh(const Rotor::Proxy::Pool::ProxyRecord& record, std::int64_t now) const;

    std::string          path_;
    std::chrono::seconds max_age_;
};

}  // namespace Storage
}  // namespace Rotor
