#include "origin.hpp"
#include <stdexcept>
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Relay {
namespace Routing {
namespace Pool {

using namespace Relay::Utils::Text;

namespace {

void check_port(const std::string& port, const std::string& text) {
    auto value = parse_uint(port);
    if (!value || *value == 0 || *value > 65535)
        throw std::runtime_error("Invalid origin port: " + text);
}

}  // namespace

Origin Origin::parse(const std::string& text) {
    std::string s = trim(text);

    auto scheme_end = s.find("://");
    if (scheme_end != std::string::npos) {
        if (to_lower(s.substr(0, scheme_end)) != "http")
            throw std::runtime_error("Unsupported origin scheme: " + text);
        s = s.substr(scheme_end + 3);
    }
    while (!s.empty() && s.back() == '/')
        s.pop_back();
    if (s.find_first_of("/?# \t") != std::string::npos)
        throw std::runtime_error("Origin must be host[:port]: " + text);

    Origin origin;
    origin.id   = s;
    origin.port = Core::Constants::DEFAULT_ORIGIN_PORT;

    if (!s.empty() && s[0] == '[') {
        auto end_bracket = s.find(']');
        if (end_bracket == std::string::npos)
            throw std::runtime_error("Unterminated IPv6 literal: " + text);
        origin.host = s.substr(0, end_bracket + 1);
        std::string rest = s.substr(end_bracket + 1);
        if (!rest.empty()) {
            if (rest[0] != ':')
                throw std::runtime_error("Origin must be host[:port]: " + text);
            origin.port = rest.substr(1);
            check_port(origin.port, text);
        }
    }
    else {
        auto colon = s.find(':');
        if (colon != std::string::npos) {
            if (s.find(':', colon + 1) != std::string::npos)
                throw std::runtime_error("IPv6 origins must be bracketed: " + text);
            origin.host = s.substr(0, colon);
            origin.port = s.substr(colon + 1);
            check_port(origin.port, text);
        }
        else {
            origin.host = s;
        }
    }

    if (origin.host.empty() || origin.host == "[]")
        throw std::runtime_error("Origin has no host: " + text);
    return origin;
}

std::string Origin::resolve_host() const {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        return host.substr(1, host.size() - 2);
    return host;
}

std::vector<Origin> parse_origins(const std::vector<std::string>& texts) {
    std::vector<Origin> origins;
    origins.reserve(texts.size());
    for (const auto& text : texts)
        origins.push_back(Origin::parse(text));
    return origins;
}

}  // namespace Pool
}  // namespace Routing
}  // namespace Relay
