#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <string>
#include <vector>
#include "../../network/http/upstream_client.hpp"
#include "../pool/origin_pool.hpp"

namespace Relay {
namespace Routing {
namespace Failover {

using Network::Http::AttemptOutcome;
using Network::Http::OutcomeKind;
using Network::Http::Request;
using Network::Http::Response;
using Network::Http::UpstreamClient;

struct AttemptRecord {
    std::string               origin;
    OutcomeKind               kind   = OutcomeKind::TransportError;
    unsigned                  status = 0;
    std::string               error;
    std::chrono::milliseconds elapsed{0};

    // "attempt origin=a:80 outcome=timeout status=0 elapsed_ms=501 error=..."
    std::string describe() const;
};

struct RouteResult {
    Response                   response;
    std::vector<AttemptRecord> attempts;
    bool                       exhausted = false;
};

// Synthetic reply for an exhausted pool.
Response make_unavailable_response(unsigned version, bool keep_alive);

// Tries origins one at a time until one answers with a success status or the
// pool runs dry. Each attempt gets a fresh `timeout` window and there is no
// delay between attempts. Never throws; every path ends in a response.
class FailoverController {
public:
    FailoverController(UpstreamClient& client, std::chrono::milliseconds timeout);

    boost::asio::awaitable<RouteResult> route(const Request& request, Pool::OriginPool& pool);

    std::chrono::milliseconds timeout() const {
        return timeout_;
    }

private:
    boost::asio::awaitable<AttemptOutcome> try_origin(const Pool::Origin& origin,
                                                      const Request&      request);

    UpstreamClient&           client_;
    std::chrono::milliseconds timeout_;
};

}  // namespace Failover
}  // namespace Routing
}  // namespace Relay
