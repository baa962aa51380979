#include "upstream_client.hpp"
#include <utility>

namespace Relay {
namespace Network {
namespace Http {

std::string to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Success:
            return "success";
        case OutcomeKind::BadStatus:
            return "bad_status";
        case OutcomeKind::Timeout:
            return "timeout";
        case OutcomeKind::TransportError:
            return "transport_error";
    }
    return "unknown";
}

AttemptOutcome AttemptOutcome::success(Response response) {
    AttemptOutcome outcome;
    outcome.kind     = OutcomeKind::Success;
    outcome.status   = response.result_int();
    outcome.response = std::move(response);
    return outcome;
}

AttemptOutcome AttemptOutcome::bad_status(unsigned status) {
    AttemptOutcome outcome;
    outcome.kind   = OutcomeKind::BadStatus;
    outcome.status = status;
    return outcome;
}

AttemptOutcome AttemptOutcome::timeout() {
    AttemptOutcome outcome;
    outcome.kind  = OutcomeKind::Timeout;
    outcome.error = "timed out";
    return outcome;
}

AttemptOutcome AttemptOutcome::transport_error(std::string cause) {
    AttemptOutcome outcome;
    outcome.kind  = OutcomeKind::TransportError;
    outcome.error = std::move(cause);
    return outcome;
}

}  // namespace Http
}  // namespace Network
}  // namespace Relay
