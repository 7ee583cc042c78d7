#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "proxy_record.hpp"

namespace Rotor {
namespace Storage {
class ProxyStore;
}

namespace Proxy {
namespace Pool {

// Ordered, duplicate-free set of proxies backed by a ProxyStore.
// Reads may come from any thread; mutation is expected from a single owner.
class ProxyPool {
public:
    ProxyPool(const std::vector<ProxyRecord>& proxies, Rotor::Storage::ProxyStore& store);

    ProxyPool(const ProxyPool&)            = delete;
    ProxyPool& operator=(const ProxyPool&) = delete;

    std::vector<ProxyRecord> snapshot() const;

    // Returns true when the proxy was present. Callers persist() afterwards.
    bool remove(const std::string& identity);

    // Overwrites the backing store with the current pool.
    // A false return means durability is degraded; the in-memory pool stays authoritative.
    bool persist();

    bool        contains(const std::string& identity) const;
    bool        empty() const;
    std::size_t size() const;

private:
    std::vector<ProxyRecord>    proxies_;
    Rotor::Storage::ProxyStore& store_;
    mutable std::mutex          mutex_;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Rotor
