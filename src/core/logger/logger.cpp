#include "logger.hpp"
#include <iostream>
#include <stdexcept>
#include "../../utils/text/string_utils.hpp"

namespace Rotor {
namespace Core {

int Logger::level_ = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS;

std::mutex Logger::mutex_;

namespace {
const std::string RESET  = "\033[0m";
const std::string RED    = "\033[31m";
const std::string GREEN  = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string BLUE   = "\033[34m";
const std::string GRAY   = "\033[90m";
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::get_level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

int Logger::level_from_name(const std::string& name) {
    std::string n = Rotor::Utils::Text::to_lower(Rotor::Utils::Text::trim(name));
    if (n == "debug")
        return LOG_ALL;
    if (n == "info")
        return LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS;
    if (n == "warning" || n == "warn")
        return LOG_WARN | LOG_ERROR;
    if (n == "error" || n == "critical")
        return LOG_ERROR;
    throw std::invalid_argument("Unknown log level: " + name);
}

void Logger::debug(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LOG_DEBUG) {
        std::cout << GRAY << "[DEBUG] " << RESET << message << std::endl;
    }
}

void Logger::info(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LOG_INFO) {
        std::cout << BLUE << "[INFO] " << RESET << message << std::endl;
    }
}

void Logger::success(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LOG_SUCCESS) {
        std::cout << GREEN << "[SUCCESS] " << RESET << message << std::endl;
    }
}

void Logger::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LOG_WARN) {
        std::cerr << YELLOW << "[WARN] " << RESET << message << std::endl;
    }
}

void Logger::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LOG_ERROR) {
        std::cerr << RED << "[ERROR] " << RESET << message << std::endl;
    }
}

}  // namespace Core
}  // namespace Rotor
