#pragma once

#include <cstddef>
#include <string>

namespace Rotor {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
std::string replace_all(std::string str, const std::string& from, const std::string& to);

// Collapses every run of characters outside [A-Za-z0-9_-] into a single '_'.
// Non-ASCII UTF-8 sequences count as word characters. The result is truncated
// to max_length code points; empty input yields "unnamed".
std::string sanitize_name(const std::string& name, std::size_t max_length = 120);

}  // namespace Text
}  // namespace Utils
}  // namespace Rotor
