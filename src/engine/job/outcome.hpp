#pragma once
#include <string>

namespace Rotor {
namespace Engine {

enum class Outcome { Success, ConnectionError, GenericError };

inline std::string to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Success:
            return "Success";
        case Outcome::ConnectionError:
            return "ConnectionError";
        case Outcome::GenericError:
            return "GenericError";
    }
    return "Unknown";
}

}  // namespace Engine
}  // namespace Rotor
