#include "domain/value_objects/PairKey.hpp"

#include "domain/errors/PoolError.hpp"

namespace amm::domain {

PairKey::PairKey(Asset low, Asset high)
    : low_(std::move(low))
    , high_(std::move(high)) {}

PairKey PairKey::of(const Asset& a, const Asset& b) {
    if (a == b) {
        throw PoolError(ErrorCode::IdenticalAssets, "pair of " + a.id() + " with itself");
    }
    return a < b ? PairKey(a, b) : PairKey(b, a);
}

bool PairKey::contains(const Asset& asset) const noexcept {
    return asset == low_ || asset == high_;
}

} // namespace amm::domain
