#include "domain/aggregates/Pair.hpp"

#include "domain/errors/PoolError.hpp"

#include <stdexcept>

namespace amm::domain {

Pair::Pair(PairKey key, Amount reserve_low, Amount reserve_high)
    : key_(std::move(key))
    , reserve_low_(std::move(reserve_low))
    , reserve_high_(std::move(reserve_high)) {}

Pair Pair::create(PairKey key, Amount reserve_low, Amount reserve_high) {
    if (reserve_low.is_zero() || reserve_high.is_zero()) {
        throw PoolError(ErrorCode::InsufficientLiquidity,
                        "initial reserves of " + key.to_string() + " must both be positive");
    }
    return Pair(std::move(key), std::move(reserve_low), std::move(reserve_high));
}

Pair Pair::apply_swap(const Asset& asset_in, const Amount& amount_in,
                      const Amount& amount_out) const {
    require_member(asset_in);
    if (key_.is_low(asset_in)) {
        return with_reserves(reserve_low_ + amount_in, reserve_high_ - amount_out);
    }
    return with_reserves(reserve_low_ - amount_out, reserve_high_ + amount_in);
}

Pair Pair::apply(const SwapExecuted& event) const {
    if (event.key != key_) {
        throw std::invalid_argument(
            "SwapExecuted for " + event.key.to_string() + " applied to " + key_.to_string());
    }
    auto low = reserve_low_ + event.amount_low_in - event.amount_low_out;
    auto high = reserve_high_ + event.amount_high_in - event.amount_high_out;
    return with_reserves(std::move(low), std::move(high));
}

const Amount& Pair::reserve_of(const Asset& asset) const {
    require_member(asset);
    return key_.is_low(asset) ? reserve_low_ : reserve_high_;
}

void Pair::require_member(const Asset& asset) const {
    if (!key_.contains(asset)) {
        throw std::out_of_range("Asset " + asset.id() + " is not part of pair " + key_.to_string());
    }
}

uint512 Pair::invariant_product() const {
    return uint512(reserve_low_.value()) * uint512(reserve_high_.value());
}

Pair Pair::with_reserves(Amount reserve_low, Amount reserve_high) const {
    Pair next(key_, std::move(reserve_low), std::move(reserve_high));
    if (next.invariant_product() < invariant_product()) {
        throw std::logic_error("Constant product invariant violated for " + key_.to_string()
            + ": reserves " + next.reserve_low_.to_string() + "*" + next.reserve_high_.to_string()
            + " below " + reserve_low_.to_string() + "*" + reserve_high_.to_string());
    }
    return next;
}

} // namespace amm::domain
