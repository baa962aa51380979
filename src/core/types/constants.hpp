#pragma once
#include <cstddef>
#include <cstdint>

namespace Relay {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_TIMEOUT_MS      = 500;
    static constexpr int         DEFAULT_BODY_TIMEOUT_MS = 10000;
    static constexpr int         DEFAULT_THREADS         = 4;   // IO Threads
    static constexpr const char* DEFAULT_BIND_IP         = "127.0.0.1";
    static constexpr int         DEFAULT_BIND_PORT       = 8080;
    static constexpr const char* DEFAULT_ORIGIN_PORT     = "80";
    static constexpr unsigned    SUCCESS_STATUS          = 200;
    static constexpr std::size_t DEFAULT_MAX_BODY_BYTES  = 8 * 1024 * 1024;   // inbound requests
    static constexpr std::size_t DEFAULT_MAX_RESPONSE_BYTES = 64 * 1024 * 1024;
    static constexpr const char* VERSION                 = "0.1.0";
    static constexpr const char* SERVER_NAME             = "relay/0.1.0";

    static constexpr const char* ENV_ORIGINS    = "RELAY_ORIGINS";
    static constexpr const char* ENV_TIMEOUT_MS = "RELAY_TIMEOUT_MS";
    static constexpr const char* ENV_RANDOM     = "RELAY_RANDOM";
    static constexpr const char* ENV_BIND_IP    = "RELAY_BIND_IP";
    static constexpr const char* ENV_BIND_PORT  = "RELAY_BIND_PORT";

    static constexpr const char* UNAVAILABLE_BODY = "Service unavailable";
};

}  // namespace Core
}  // namespace Relay
