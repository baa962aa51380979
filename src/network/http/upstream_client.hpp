#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <optional>
#include <string>
#include "../../routing/pool/origin.hpp"

namespace Relay {
namespace Network {
namespace Http {

using Request  = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

enum class OutcomeKind { Success, BadStatus, Timeout, TransportError };

std::string to_string(OutcomeKind kind);

struct AttemptOutcome {
    OutcomeKind               kind   = OutcomeKind::TransportError;
    unsigned                  status = 0;
    std::optional<Response>   response;  // set only for Success
    std::string               error;
    std::chrono::milliseconds elapsed{0};

    bool ok() const {
        return kind == OutcomeKind::Success;
    }

    static AttemptOutcome success(Response response);
    static AttemptOutcome bad_status(unsigned status);
    static AttemptOutcome timeout();
    static AttemptOutcome transport_error(std::string cause);
};

// One bounded outbound exchange with a single origin.
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    virtual boost::asio::awaitable<AttemptOutcome> attempt(const Routing::Pool::Origin& origin,
                                                           const Request&               request,
                                                           std::chrono::milliseconds    timeout) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Relay
