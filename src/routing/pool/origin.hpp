#pragma once
#include <string>
#include <vector>

namespace Relay {
namespace Routing {
namespace Pool {

struct Origin {
    std::string id;    // As configured, minus any "http://" prefix. Used for Host and logs.
    std::string host;  // IPv6 literals keep their brackets.
    std::string port;

    // Accepts "host", "host:port", "[v6]:port" and an optional "http://" prefix.
    // Throws std::runtime_error on an empty host, a bad port or another scheme.
    static Origin parse(const std::string& text);

    // Host without IPv6 brackets, as the resolver wants it.
    std::string resolve_host() const;

    bool operator==(const Origin& other) const {
        return host == other.host && port == other.port;
    }
};

// Parses every entry; the first bad one throws std::runtime_error.
std::vector<Origin> parse_origins(const std::vector<std::string>& texts);

}  // namespace Pool
}  // namespace Routing
}  // namespace Relay
