#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <string>
#include <vector>
#include "../../core/types/constants.hpp"
#include "upstream_client.hpp"

namespace Relay {
namespace Network {
namespace Http {

struct ClientOptions {
    std::vector<unsigned>     success_statuses = {Core::Constants::SUCCESS_STATUS};
    std::chrono::milliseconds body_timeout{Core::Constants::DEFAULT_BODY_TIMEOUT_MS};
    std::size_t               max_response_bytes = Core::Constants::DEFAULT_MAX_RESPONSE_BYTES;
};

// Copy of `inbound` addressed to `origin`: same method, target and body, Host
// rewritten, hop-by-hop headers and Expect dropped, one request per connection.
Request make_upstream_request(const Routing::Pool::Origin& origin, const Request& inbound);

// Plain HTTP/1.1 over a fresh connection per attempt.
//
// The attempt timeout is a single deadline covering name resolution, connect,
// request write and the response head. Once the head is in, the body gets
// its own `body_timeout` window and a failure there is a transport error.
class BeastClient : public UpstreamClient {
public:
    explicit BeastClient(ClientOptions options = {});
    ~BeastClient() override = default;

    boost::asio::awaitable<AttemptOutcome> attempt(const Routing::Pool::Origin& origin,
                                                   const Request&               request,
                                                   std::chrono::milliseconds    timeout) override;

    bool is_success(unsigned status) const;

private:
    ClientOptions options_;

    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type>
    resolve(const Routing::Pool::Origin& origin, std::chrono::steady_clock::time_point deadline);

    boost::asio::awaitable<AttemptOutcome> exchange(const Routing::Pool::Origin&          origin,
                                                    const Request&                        request,
                                                    std::chrono::steady_clock::time_point deadline,
                                                    bool& head_received);
};

}  // namespace Http
}  // namespace Network
}  // namespace Relay
