#include "origin_pool.hpp"
#include <utility>

namespace Relay {
namespace Routing {
namespace Pool {

std::string to_string(SelectionPolicy policy) {
    return policy == SelectionPolicy::Random ? "random" : "sequential";
}

OriginPool::OriginPool(std::vector<Origin> origins, SelectionPolicy policy)
    : origins_(std::move(origins)), policy_(policy), rng_(std::random_device{}()) {
}

OriginPool::OriginPool(std::vector<Origin> origins, SelectionPolicy policy, std::uint32_t seed)
    : origins_(std::move(origins)), policy_(policy), rng_(seed) {
}

std::optional<Origin> OriginPool::next() {
    if (empty())
        return std::nullopt;

    if (policy_ == SelectionPolicy::Random) {
        // Uniform over what is left, then park the pick at the cursor.
        std::uniform_int_distribution<size_t> dist(cursor_, origins_.size() - 1);
        std::swap(origins_[cursor_], origins_[dist(rng_)]);
    }
    return origins_[cursor_++];
}

bool OriginPool::empty() const {
    return cursor_ >= origins_.size();
}

size_t OriginPool::remaining() const {
    return origins_.size() - cursor_;
}

}  // namespace Pool
}  // namespace Routing
}  // namespace Relay
