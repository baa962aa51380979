#include "failover_controller.hpp"
#include <utility>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"

namespace Relay {
namespace Routing {
namespace Failover {

using namespace Relay::Core;
namespace http = boost::beast::http;

std::string AttemptRecord::describe() const {
    std::string line = "attempt origin=" + origin + " outcome=" + Network::Http::to_string(kind)
                       + " status=" + std::to_string(status)
                       + " elapsed_ms=" + std::to_string(elapsed.count());
    if (!error.empty())
        line += " error=\"" + error + "\"";
    return line;
}

Response make_unavailable_response(unsigned version, bool keep_alive) {
    Response res{http::status::service_unavailable, version};
    res.set(http::field::server, Constants::SERVER_NAME);
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(keep_alive);
    res.body() = Constants::UNAVAILABLE_BODY;
    res.prepare_payload();
    return res;
}

FailoverController::FailoverController(UpstreamClient& client, std::chrono::milliseconds timeout)
    : client_(client), timeout_(timeout) {
}

boost::asio::awaitable<AttemptOutcome> FailoverController::try_origin(const Pool::Origin& origin,
                                                                      const Request& request) {
    AttemptOutcome outcome;
    try {
        outcome = co_await client_.attempt(origin, request, timeout_);
    } catch (const std::exception& e) {
        outcome = AttemptOutcome::transport_error(e.what());
    }
    co_return outcome;
}

boost::asio::awaitable<RouteResult> FailoverController::route(const Request&    request,
                                                              Pool::OriginPool& pool) {
    RouteResult result;

    while (!pool.empty()) {
        auto origin = pool.next();
        if (!origin)
            break;

        AttemptOutcome outcome = co_await try_origin(*origin, request);

        AttemptRecord record;
        record.origin  = origin->id;
        record.kind    = outcome.kind;
        record.status  = outcome.status;
        record.error   = outcome.error;
        record.elapsed = outcome.elapsed;
        result.attempts.push_back(record);

        if (outcome.ok() && outcome.response) {
            Logger::success(record.describe());
            result.response = std::move(*outcome.response);
            co_return result;
        }
        Logger::warn(record.describe());
    }

    Logger::error("origins exhausted after " + std::to_string(result.attempts.size())
                  + " attempt(s) for " + std::string(request.method_string()) + " "
                  + std::string(request.target()));
    result.exhausted = true;
    result.response  = make_unavailable_response(request.version(), request.keep_alive());
    co_return result;
}

}  // namespace Failover
}  // namespace Routing
}  // namespace Relay
