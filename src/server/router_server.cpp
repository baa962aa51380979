#include "router_server.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../core/logger/logger.hpp"
#include "connection.hpp"

namespace Relay {
namespace Server {

using namespace Relay::Core;
using Routing::Pool::OriginPool;
using Routing::Pool::SelectionPolicy;

namespace {

Network::Http::ClientOptions client_options(const Config& config) {
    Network::Http::ClientOptions options;
    options.success_statuses = config.success_statuses;
    options.body_timeout     = std::chrono::milliseconds(config.body_timeout_ms);
    options.max_response_bytes = config.max_response_bytes;
    return options;
}

SelectionPolicy policy_of(const Config& config) {
    return config.random ? SelectionPolicy::Random : SelectionPolicy::Sequential;
}

}  // namespace

RouterServer::RouterServer(const Config& config)
    : origins_(Routing::Pool::parse_origins(config.origins)),
      policy_(policy_of(config)),
      bind_ip_(config.bind_ip),
      bind_port_(config.bind_port),
      thread_count_(config.threads),
      max_body_bytes_(config.max_body_bytes),
      owned_client_(std::make_unique<Network::Http::BeastClient>(client_options(config))),
      controller_(*owned_client_, std::chrono::milliseconds(config.timeout_ms)),
      acceptor_(io_context_) {
}

RouterServer::RouterServer(const Config& config, Network::Http::UpstreamClient& client)
    : origins_(Routing::Pool::parse_origins(config.origins)),
      policy_(policy_of(config)),
      bind_ip_(config.bind_ip),
      bind_port_(config.bind_port),
      thread_count_(config.threads),
      max_body_bytes_(config.max_body_bytes),
      controller_(client, std::chrono::milliseconds(config.timeout_ms)),
      acceptor_(io_context_) {
}

RouterServer::~RouterServer() {
    stop();
}

bool RouterServer::start() {
    try {
        boost::asio::ip::tcp::resolver resolver(io_context_);
        boost::asio::ip::tcp::endpoint endpoint =
            *resolver.resolve(bind_ip_, std::to_string(bind_port_)).begin();

        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        port_ = acceptor_.local_endpoint().port();
        Logger::info("RouterServer: listening on " + bind_ip_ + ":" + std::to_string(port_) + " ("
                     + std::to_string(origins_.size()) + " origin(s), "
                     + Routing::Pool::to_string(policy_) + ", "
                     + std::to_string(controller_.timeout().count()) + "ms per attempt)");

        boost::asio::co_spawn(io_context_, do_accept(), boost::asio::detached);

        for (int i = 0; i < thread_count_; ++i) {
            threads_.emplace_back([this]() { io_context_.run(); });
        }
        return true;
    } catch (const std::exception& e) {
        Logger::error("RouterServer: cannot listen on " + bind_ip_ + ":"
                      + std::to_string(bind_port_) + ": " + std::string(e.what()));
        return false;
    }
}

void RouterServer::stop() {
    if (!io_context_.stopped()) {
        io_context_.stop();
    }
    for (auto& t : threads_) {
        if (t.joinable())
            t.join();
    }
    threads_.clear();
}

int RouterServer::get_port() const {
    return port_;
}

OriginPool RouterServer::make_pool() const {
    return OriginPool(origins_, policy_);
}

boost::asio::awaitable<void> RouterServer::do_accept() {
    while (true) {
        try {
            // Each connection runs on its own strand.
            auto socket = co_await acceptor_.async_accept(boost::asio::make_strand(io_context_),
                                                          boost::asio::use_awaitable);
            std::make_shared<Connection>(std::move(socket), this)->start();
        } catch (const std::exception& e) {
            Logger::error("RouterServer: Accept error: " + std::string(e.what()));
        }
    }
}

}  // namespace Server
}  // namespace Relay
