#include "proxy_pool.hpp"
#include <algorithm>
#include <unordered_set>
#include "../../core/logger/logger.hpp"
#include "../../storage/proxy_store.hpp"

namespace Rotor {
namespace Proxy {
namespace Pool {

using namespace Rotor::Core;

ProxyPool::ProxyPool(const std::vector<ProxyRecord>& proxies, Rotor::Storage::ProxyStore& store)
    : store_(store) {
    std::unordered_set<std::string> seen;
    for (const auto& p : proxies) {
        if (!seen.insert(p.identity()).second) {
            Logger::warn("Duplicate proxy ignored: " + p.identity());
            continue;
        }
        proxies_.push_back(p);
    }
}

std::vector<ProxyRecord> ProxyPool::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_;
}

bool ProxyPool::remove(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) {
        return p.identity() == identity;
    });
    if (it == proxies_.end())
        return false;

    proxies_.erase(it);
    return true;
}

bool ProxyPool::persist() {
    std::vector<ProxyRecord> current = snapshot();
    if (!store_.save(current)) {
        Logger::error("Proxy pool persist failed (" + std::to_string(current.size())
                      + " proxies kept in memory)");
        return false;
    }
    Logger::debug("Proxy pool persisted (" + std::to_string(current.size()) + " proxies)");
    return true;
}

bool ProxyPool::contains(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) {
        return p.identity() == identity;
    });
}

bool ProxyPool::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.empty();
}

std::size_t ProxyPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.size();
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Rotor
