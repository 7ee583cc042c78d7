#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace Rotor {
namespace Proxy {
namespace Pool {

struct ProxyRecord {
    std::string  host;
    int          port         = 0;
    std::int64_t last_checked = 0;  // Unix seconds, 0 when unknown

    // Fields the engine does not interpret, written back verbatim on persist.
    nlohmann::json attributes = nlohmann::json::object();

    // Uniqueness key
    std::string identity() const {
        return host + ":" + std::to_string(port);
    }

    bool operator==(const ProxyRecord& other) const {
        return host == other.host && port == other.port;
    }
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Rotor
