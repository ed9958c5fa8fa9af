#pragma once

#include "domain/events/SwapExecuted.hpp"
#include "domain/value_objects/Amount.hpp"
#include "domain/value_objects/Asset.hpp"
#include "domain/value_objects/PairKey.hpp"

namespace amm::domain {

class Pair {
public:
    // Factory; both reserves must be positive
    static Pair create(PairKey key, Amount reserve_low, Amount reserve_high);

    // Transitions return a new Pair (immutable). Both throw std::logic_error
    // if the result would lower reserve_low * reserve_high.
    Pair apply_swap(const Asset& asset_in, const Amount& amount_in,
                    const Amount& amount_out) const;
    Pair apply(const SwapExecuted& event) const;

    // Queries
    const PairKey& key() const noexcept { return key_; }
    const Asset& asset_low() const noexcept { return key_.low(); }
    const Asset& asset_high() const noexcept { return key_.high(); }
    const Amount& reserve_low() const noexcept { return reserve_low_; }
    const Amount& reserve_high() const noexcept { return reserve_high_; }
    const Amount& reserve_of(const Asset& asset) const;
    uint512 invariant_product() const;

    bool operator==(const Pair&) const = default;

private:
    Pair(PairKey key, Amount reserve_low, Amount reserve_high);

    Pair with_reserves(Amount reserve_low, Amount reserve_high) const;
    void require_member(const Asset& asset) const;

    PairKey key_;
    Amount reserve_low_;
    Amount reserve_high_;
};

} // namespace amm::domain
