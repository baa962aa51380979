#include "beast_client.hpp"
#include <array>
#include <boost/asio/redirect_error.hpp>
#include <memory>
#include <optional>
#include <utility>
#include "../../core/logger/logger.hpp"

namespace Relay {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;
using Clock     = std::chrono::steady_clock;

using Routing::Pool::Origin;

namespace {

constexpr std::array<http::field, 10> SKIPPED_FIELDS = {http::field::connection,
                                                       http::field::keep_alive,
                                                       http::field::proxy_connection,
                                                       http::field::te,
                                                       http::field::trailer,
                                                       http::field::upgrade,
                                                       http::field::transfer_encoding,
                                                       http::field::content_length,
                                                       http::field::host,
                                                       http::field::expect};

bool skip_field(const Request& inbound, const http::fields::value_type& f) {
    for (auto name : SKIPPED_FIELDS) {
        if (f.name() == name)
            return true;
    }
    // Anything the client declared connection-specific stays on that connection too.
    auto conn = inbound.find(http::field::connection);
    if (conn != inbound.end()) {
        for (const auto& token : http::token_list{conn->value()}) {
            if (beast::iequals(token, f.name_string()))
                return true;
        }
    }
    return false;
}

// Name resolution raced against the attempt deadline. getaddrinfo cannot be
// interrupted, so the coroutine waits on `signal` instead of the resolver and
// whichever of resolver or watchdog finishes first wakes it. Late callbacks
// keep this state alive through their shared_ptr.
struct Resolution {
    explicit Resolution(const net::any_io_executor& ex)
        : resolver(ex), watchdog(ex), signal(ex) {
        signal.expires_at(net::steady_timer::time_point::max());
    }

    void finish(const boost::system::error_code& e, tcp::resolver::results_type r = {}) {
        if (done)
            return;
        done    = true;
        ec      = e;
        results = std::move(r);
        watchdog.cancel();
        signal.cancel();
    }

    tcp::resolver               resolver;
    net::steady_timer           watchdog;
    net::steady_timer           signal;
    bool                        done = false;
    boost::system::error_code   ec;
    tcp::resolver::results_type results;
};

void close_stream(beast::tcp_stream& stream) {
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream.socket().close(ec);
}

}  // namespace

Request make_upstream_request(const Origin& origin, const Request& inbound) {
    Request req;
    req.version(11);
    if (inbound.method() == http::verb::unknown)
        req.method_string(inbound.method_string());
    else
        req.method(inbound.method());
    req.target(inbound.target());

    for (const auto& f : inbound) {
        if (!skip_field(inbound, f))
            req.insert(f.name_string(), f.value());
    }
    req.set(http::field::host, origin.id);
    req.keep_alive(false);

    req.body() = inbound.body();
    req.prepare_payload();
    return req;
}

BeastClient::BeastClient(ClientOptions options) : options_(std::move(options)) {
    if (options_.success_statuses.empty())
        options_.success_statuses = {Core::Constants::SUCCESS_STATUS};
}

bool BeastClient::is_success(unsigned status) const {
    for (auto s : options_.success_statuses) {
        if (s == status)
            return true;
    }
    return false;
}

net::awaitable<AttemptOutcome>
BeastClient::attempt(const Origin& origin, const Request& request, std::chrono::milliseconds timeout) {
    auto started       = Clock::now();
    bool head_received = false;

    AttemptOutcome outcome;
    try {
        outcome = co_await exchange(origin, request, started + timeout, head_received);
    } catch (const boost::system::system_error& e) {
        if (!head_received && e.code() == beast::error::timeout)
            outcome = AttemptOutcome::timeout();
        else
            outcome = AttemptOutcome::transport_error(e.code().message());
    } catch (const std::exception& e) {
        outcome = AttemptOutcome::transport_error(e.what());
    }

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    co_return outcome;
}

net::awaitable<tcp::resolver::results_type>
BeastClient::resolve(const Origin& origin, Clock::time_point deadline) {
    auto res = std::make_shared<Resolution>(co_await net::this_coro::executor);

    res->watchdog.expires_at(deadline);
    res->watchdog.async_wait([res](const boost::system::error_code& ec) {
        if (!ec)
            res->finish(beast::error::timeout);
    });
    res->resolver.async_resolve(
        origin.resolve_host(),
        origin.port,
        [res](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            res->finish(ec, std::move(results));
        });

    if (!res->done) {
        boost::system::error_code wait_ec;
        co_await res->signal.async_wait(net::redirect_error(net::use_awaitable, wait_ec));
    }

    if (res->ec) {
        res->resolver.cancel();
        throw boost::system::system_error(res->ec);
    }
    co_return res->results;
}

net::awaitable<AttemptOutcome> BeastClient::exchange(const Origin&     origin,
                                                     const Request&    request,
                                                     Clock::time_point deadline,
                                                     bool&             head_received) {
    auto results = co_await resolve(origin, deadline);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_at(deadline);
    co_await stream.async_connect(results, net::use_awaitable);

    auto upstream_req = make_upstream_request(origin, request);
    co_await http::async_write(stream, upstream_req, net::use_awaitable);

    // Interim 1xx heads (100 Continue, 103 Early Hints) precede the real one;
    // each needs a fresh parser. 101 is final since nothing here upgrades.
    beast::flat_buffer                                      buffer;
    std::optional<http::response_parser<http::string_body>> parser;
    unsigned                                                status = 0;
    do {
        parser.emplace();
        parser->body_limit(options_.max_response_bytes);
        if (request.method() == http::verb::head)
            parser->skip(true);

        co_await http::async_read_header(stream, buffer, *parser, net::use_awaitable);
        status = parser->get().result_int();
    } while (status >= 100 && status < 200 && status != 101);
    head_received = true;

    if (!is_success(status)) {
        close_stream(stream);
        co_return AttemptOutcome::bad_status(status);
    }

    stream.expires_after(options_.body_timeout);
    if (!parser->is_done())
        co_await http::async_read(stream, buffer, *parser, net::use_awaitable);

    close_stream(stream);
    Core::Logger::debug("upstream " + origin.id + " answered " + std::to_string(status) + " with "
                        + std::to_string(parser->get().body().size()) + " body bytes");
    co_return AttemptOutcome::success(parser->release());
}

}  // namespace Http
}  // namespace Network
}  // namespace Relay
