#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Relay {
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

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> parts;
    std::stringstream        ss(str);
    std::string              item;
    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty())
            parts.push_back(item);
    }
    return parts;
}

std::optional<bool> parse_bool(const std::string& str) {
    std::string v = to_lower(trim(str));
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<long> parse_uint(const std::string& str) {
    std::string v = trim(str);
    if (v.empty() || v.size() > 18)
        return std::nullopt;
    long value = 0;
    for (char c : v) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Relay
