#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../../utils/text/string_utils.hpp"

namespace Relay {
namespace Core {

using namespace Relay::Utils::Text;

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

// Digits only and no larger than `max`.
std::optional<int> parse_bounded(const char* text, long max) {
    auto value = parse_uint(text);
    if (!value || *value > max)
        return std::nullopt;
    return static_cast<int>(*value);
}

void normalize(Config& config) {
    if (config.timeout_ms <= 0)
        config.timeout_ms = Constants::DEFAULT_TIMEOUT_MS;
    if (config.body_timeout_ms <= 0)
        config.body_timeout_ms = Constants::DEFAULT_BODY_TIMEOUT_MS;
    if (config.threads <= 0)
        config.threads = 1;
    if (config.success_statuses.empty())
        config.success_statuses = {Constants::SUCCESS_STATUS};
}

}  // namespace

void load_env(Config& config) {
    if (const char* origins = env(Constants::ENV_ORIGINS))
        config.origins = split(origins, ',');

    if (const char* timeout = env(Constants::ENV_TIMEOUT_MS)) {
        auto ms           = parse_bounded(timeout, std::numeric_limits<int>::max());
        config.timeout_ms = ms.value_or(Constants::DEFAULT_TIMEOUT_MS);
    }

    if (const char* random = env(Constants::ENV_RANDOM)) {
        if (auto flag = parse_bool(random))
            config.random = *flag;
    }

    if (const char* ip = env(Constants::ENV_BIND_IP))
        config.bind_ip = ip;

    if (const char* port = env(Constants::ENV_BIND_PORT)) {
        if (auto p = parse_bounded(port, 65535))
            config.bind_port = *p;
    }
}

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);

        if (yaml["origins"]) {
            if (yaml["origins"].IsSequence()) {
                config.origins.clear();
                for (const auto& node : yaml["origins"])
                    config.origins.push_back(trim(node.as<std::string>()));
            }
            else {
                config.origins = split(yaml["origins"].as<std::string>(), ',');
            }
        }
        if (yaml["timeout_ms"])
            config.timeout_ms = yaml["timeout_ms"].as<int>();
        if (yaml["random"])
            config.random = yaml["random"].as<bool>();
        if (yaml["bind_ip"])
            config.bind_ip = yaml["bind_ip"].as<std::string>();
        if (yaml["bind_port"])
            config.bind_port = yaml["bind_port"].as<int>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["body_timeout_ms"])
            config.body_timeout_ms = yaml["body_timeout_ms"].as<int>();
        if (yaml["max_body_bytes"])
            config.max_body_bytes = yaml["max_body_bytes"].as<std::size_t>();
        if (yaml["max_response_bytes"])
            config.max_response_bytes = yaml["max_response_bytes"].as<std::size_t>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();

        if (yaml["success_statuses"] && yaml["success_statuses"].IsSequence()) {
            config.success_statuses.clear();
            for (const auto& node : yaml["success_statuses"])
                config.success_statuses.push_back(node.as<unsigned>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config config;
    load_env(config);

    CLI::App app{"Relay - per-request HTTP failover router"};

    app.add_option("-o,--origins", config.origins, "Origins to try, in order (host[:port])")
        ->delimiter(',');
    app.add_option("-t,--timeout", config.timeout_ms, "Per-attempt timeout in milliseconds");
    app.add_flag("--random", config.random, "Pick origins at random instead of in order");
    app.add_option("--bind-ip", config.bind_ip, "Listen address");
    app.add_option("-p,--port", config.bind_port, "Listen port (0 = random)");
    app.add_option("--threads", config.threads, "IO threads");
    app.add_option("--body-timeout", config.body_timeout_ms, "Upstream body read timeout (ms)");
    app.add_option("--max-body", config.max_body_bytes, "Largest inbound request body (bytes)");
    app.add_option(
        "--max-response", config.max_response_bytes, "Largest upstream response body (bytes)");
    app.add_option("--success-status", config.success_statuses, "Statuses that end failover")
        ->delimiter(',');
    app.add_option("--log-level", config.log_level, "none, error, warn, info or debug");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        // Command line wins over the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    normalize(config);
    return config;
}

}  // namespace Core
}  // namespace Relay
