#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace Rotor {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

std::string replace_all(std::string str, const std::string& from, const std::string& to) {
    if (from.empty())
        return str;
    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }
    return str;
}

std::string sanitize_name(const std::string& name, std::size_t max_length) {
    std::string trimmed = trim(name);
    std::string out;
    out.reserve(trimmed.size());

    // Bytes >= 0x80 belong to UTF-8 sequences and are kept as word characters.
    bool        in_run      = false;
    std::size_t code_points = 0;
    for (unsigned char c : trimmed) {
        const bool continuation = (c & 0xC0) == 0x80;
        const bool word         = c >= 0x80 || std::isalnum(c) || c == '_' || c == '-';

        if (!continuation) {
            if (!word && in_run)
                continue;
            if (code_points == max_length)
                break;
            code_points++;
        }

        out.push_back(word ? static_cast<char>(c) : '_');
        in_run = !word;
    }

    return out.empty() ? "unnamed" : out;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Rotor
