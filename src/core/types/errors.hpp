#pragma once
#include <stdexcept>
#include <string>

namespace Rotor {
namespace Core {

// Thrown by a work function when the proxy cannot reach the target service.
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {
    }
};

// Retryable failure of a single attempt.
class AttemptError : public std::runtime_error {
public:
    explicit AttemptError(const std::string& what) : std::runtime_error(what) {
    }
};

// Never classified: aborts the whole run.
class FatalError : public std::runtime_error {
public:
    explicit FatalError(const std::string& what) : std::runtime_error(what) {
    }
};

}  // namespace Core
}  // namespace Rotor
