#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Relay {
namespace Core {

struct Config {
    std::vector<std::string> origins;
    int                      timeout_ms = Constants::DEFAULT_TIMEOUT_MS;  // per attempt
    bool                     random     = false;

    std::string bind_ip   = Constants::DEFAULT_BIND_IP;
    int         bind_port = Constants::DEFAULT_BIND_PORT;
    int         threads   = Constants::DEFAULT_THREADS;

    int                   body_timeout_ms  = Constants::DEFAULT_BODY_TIMEOUT_MS;
    std::size_t           max_body_bytes   = Constants::DEFAULT_MAX_BODY_BYTES;
    std::size_t           max_response_bytes = Constants::DEFAULT_MAX_RESPONSE_BYTES;
    std::vector<unsigned> success_statuses = {Constants::SUCCESS_STATUS};
    std::string           log_level        = "info";
    std::string           config_path;

    // Defaults < RELAY_* environment < YAML (--config) < command line.
    static Config parse(int argc, char* argv[]);
};

// Environment layer on its own; missing or unparsable values leave `config` untouched,
// except RELAY_TIMEOUT_MS which falls back to the default when present but not a
// number that fits an int.
void load_env(Config& config);

// Throws std::runtime_error when the file is missing or malformed.
void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Relay
