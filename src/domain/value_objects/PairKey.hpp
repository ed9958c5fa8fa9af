#pragma once

#include "domain/value_objects/Asset.hpp"

#include <compare>
#include <string>

namespace amm::domain {

// Canonical identity of a pool: two distinct assets ordered low < high.
// Both argument orders of of() produce the same key.
class PairKey {
public:
    static PairKey of(const Asset& a, const Asset& b);

    const Asset& low() const noexcept { return low_; }
    const Asset& high() const noexcept { return high_; }

    bool contains(const Asset& asset) const noexcept;
    bool is_low(const Asset& asset) const noexcept { return asset == low_; }

    std::string to_string() const { return low_.id() + "/" + high_.id(); }

    bool operator==(const PairKey&) const = default;
    auto operator<=>(const PairKey&) const = default;

private:
    PairKey(Asset low, Asset high);

    Asset low_;
    Asset high_;
};

} // namespace amm::domain
