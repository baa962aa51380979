#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Relay {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);

// Splits on `delim`, trims every piece and drops empty ones.
std::vector<std::string> split(const std::string& str, char delim);

// "1", "true", "yes", "on" / "0", "false", "no", "off" (case-insensitive).
std::optional<bool> parse_bool(const std::string& str);

// Whole-string non-negative decimal integer, nullopt otherwise.
std::optional<long> parse_uint(const std::string& str);

}  // namespace Text
}  // namespace Utils
}  // namespace Relay
