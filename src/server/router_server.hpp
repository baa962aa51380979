#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "../core/config/config.hpp"
#include "../network/http/beast_client.hpp"
#include "../routing/failover/failover_controller.hpp"
#include "../routing/pool/origin_pool.hpp"

namespace Relay {
namespace Server {

class Connection;

// Accepts HTTP/1.1 clients and hands every request to the failover controller.
// Origins and policy are fixed at construction; each request gets a fresh pool.
class RouterServer {
public:
    // Throws std::runtime_error if an origin in `config` does not parse.
    explicit RouterServer(const Core::Config& config);
    RouterServer(const Core::Config& config, Network::Http::UpstreamClient& client);
    ~RouterServer();

    bool start();
    void stop();
    int  get_port() const;

    Routing::Pool::OriginPool make_pool() const;

    Routing::Failover::FailoverController& controller() {
        return controller_;
    }
    std::size_t max_body_bytes() const {
        return max_body_bytes_;
    }

private:
    boost::asio::awaitable<void> do_accept();

    std::vector<Routing::Pool::Origin>          origins_;
    Routing::Pool::SelectionPolicy              policy_;
    std::string                                 bind_ip_;
    int                                         bind_port_;
    int                                         thread_count_;
    std::size_t                                 max_body_bytes_;
    int                                         port_ = 0;
    std::unique_ptr<Network::Http::BeastClient> owned_client_;
    Routing::Failover::FailoverController       controller_;

    boost::asio::io_context        io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread>       threads_;
};

}  // namespace Server
}  // namespace Relay
