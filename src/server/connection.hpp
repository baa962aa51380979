#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include "../network/http/upstream_client.hpp"

namespace Relay {
namespace Server {

using Network::Http::Request;
using Network::Http::Response;

class RouterServer;

// Adjusts an upstream response for the client connection it goes back on:
// version, keep-alive and body framing. Status, headers and body are untouched.
void frame_response(Response& res, const Request& req);

class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(boost::asio::ip::tcp::socket socket, RouterServer* server);
    ~Connection();

    void start();

private:
    boost::asio::awaitable<void> serve();
    boost::asio::awaitable<void> reply_bad_request(const std::string& reason);
    void                         close();

    boost::beast::tcp_stream  stream_;
    boost::beast::flat_buffer buffer_;
    RouterServer*             server_;

    static constexpr int kIdleTimeoutSeconds = 30;
};

}  // namespace Server
}  // namespace Relay
