#include "connection.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "router_server.hpp"

namespace Relay {
namespace Server {

using namespace Relay::Core;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;

void frame_response(Response& res, const Request& req) {
    if (req.version() < 11 && res.chunked()) {
        res.chunked(false);
    }
    res.version(req.version());
    res.keep_alive(req.keep_alive());
    if (req.method() != http::verb::head && !res.chunked() && !res.has_content_length()) {
        // Upstream delimited the body by closing; give the client a length instead.
        res.prepare_payload();
    }
}

Connection::Connection(net::ip::tcp::socket socket, RouterServer* server)
    : stream_(std::move(socket)), server_(server) {
}

Connection::~Connection() {
    close();
}

void Connection::start() {
    net::co_spawn(
        stream_.get_executor(),
        [self = shared_from_this()]() { return self->serve(); },
        net::detached);
}

void Connection::close() {
    beast::error_code ec;
    if (stream_.socket().is_open()) {
        stream_.socket().shutdown(net::ip::tcp::socket::shutdown_send, ec);
        stream_.socket().close(ec);
    }
}

net::awaitable<void> Connection::reply_bad_request(const std::string& reason) {
    http::response<http::string_body> res{http::status::bad_request, 11};
    res.set(http::field::server, Constants::SERVER_NAME);
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(false);
    res.body() = "Bad request: " + reason;
    res.prepare_payload();

    beast::error_code ec;
    stream_.expires_after(std::chrono::seconds(kIdleTimeoutSeconds));
    co_await http::async_write(stream_, res, net::redirect_error(net::use_awaitable, ec));
}

net::awaitable<void> Connection::serve() {
    try {
        while (true) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(server_->max_body_bytes());

            beast::error_code ec;
            stream_.expires_after(std::chrono::seconds(kIdleTimeoutSeconds));
            co_await http::async_read_header(
                stream_, buffer_, parser, net::redirect_error(net::use_awaitable, ec));

            // Whole body is read before routing.
            if (!ec && parser.get().version() >= 11
                && beast::iequals(parser.get()[http::field::expect], "100-continue")) {
                http::response<http::empty_body> interim{http::status::continue_, 11};
                co_await http::async_write(
                    stream_, interim, net::redirect_error(net::use_awaitable, ec));
            }
            if (!ec && !parser.is_done()) {
                co_await http::async_read(
                    stream_, buffer_, parser, net::redirect_error(net::use_awaitable, ec));
            }

            if (ec == http::error::end_of_stream || ec == beast::error::timeout
                || ec == net::error::eof || ec == net::error::connection_reset
                || ec == net::error::broken_pipe) {
                break;
            }
            if (ec) {
                Logger::debug("Connection: unreadable request: " + ec.message());
                co_await reply_bad_request(ec.message());
                break;
            }

            Request req = parser.release();
            stream_.expires_never();

            auto pool   = server_->make_pool();
            auto result = co_await server_->controller().route(req, pool);

            Response res = std::move(result.response);
            frame_response(res, req);
            Logger::info(std::string(req.method_string()) + " " + std::string(req.target()) + " -> "
                         + std::to_string(res.result_int()) + " ("
                         + std::to_string(result.attempts.size()) + " attempt(s))");

            bool keep_alive = res.keep_alive();
            stream_.expires_after(std::chrono::seconds(kIdleTimeoutSeconds));
            co_await http::async_write(stream_, res, net::use_awaitable);

            if (!keep_alive)
                break;
        }
    } catch (const std::exception& e) {
        Logger::debug("Connection: " + std::string(e.what()));
    }
    close();
}

}  // namespace Server
}  // namespace Relay
