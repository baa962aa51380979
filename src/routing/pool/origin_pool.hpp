#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "origin.hpp"

namespace Relay {
namespace Routing {
namespace Pool {

enum class SelectionPolicy { Sequential, Random };

std::string to_string(SelectionPolicy policy);

// Candidate origins for one inbound request. Owns its copy of the list and
// only ever shrinks: everything before cursor_ has been handed out.
// Not thread-safe; one instance per request.
class OriginPool {
public:
    OriginPool(std::vector<Origin> origins, SelectionPolicy policy);
    OriginPool(std::vector<Origin> origins, SelectionPolicy policy, std::uint32_t seed);

    // Removes and returns the next candidate, nullopt once exhausted.
    std::optional<Origin> next();

    bool            empty() const;
    size_t          remaining() const;
    SelectionPolicy policy() const {
        return policy_;
    }

private:
    std::vector<Origin> origins_;
    size_t              cursor_ = 0;
    SelectionPolicy     policy_;
    std::mt19937        rng_;
};

}  // namespace Pool
}  // namespace Routing
}  // namespace Relay
