#pragma once
#include <vector>
#include "../proxy/pool/proxy_record.hpp"

namespace Rotor {
namespace Storage {

class ProxyStore {
public:
    virtual ~ProxyStore() = default;

    virtual std::vector<Rotor::Proxy::Pool::ProxyRecord> load() = 0;

    // Full overwrite of the stored collection. Returns false on I/O failure.
    virtual bool save(const std::vector<Rotor::Proxy::Pool::ProxyRecord>& proxies) = 0;
};

}  // namespace Storage
}  // namespace Rotor
