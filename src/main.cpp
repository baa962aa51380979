#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <stdexcept>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "server/router_server.hpp"

using namespace Relay::Core;

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parse(argc, argv);
        Logger::set_level(Logger::parse_level(config.log_level));
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    if (config.origins.empty())
        Logger::warn("No origins configured; every request will get 503.");

    try {
        Relay::Server::RouterServer server(config);
        if (!server.start())
            return 1;

        boost::asio::io_context signals_ctx;
        boost::asio::signal_set signals(signals_ctx, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code&, int signo) {
            Logger::info("Caught signal " + std::to_string(signo) + ", shutting down");
        });
        signals_ctx.run();

        server.stop();
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
    return 0;
}
