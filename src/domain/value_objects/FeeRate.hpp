#pragma once

#include <cstdint>

namespace amm::domain {

// Fraction numerator/denominator of every swap input retained by the pool.
class FeeRate {
public:
    FeeRate(uint32_t numerator, uint32_t denominator);

    // 0.3%
    static FeeRate standard();

    uint32_t numerator() const noexcept { return numerator_; }
    uint32_t denominator() const noexcept { return denominator_; }

    // Share of the input that is priced, in units of 1/denominator (997 for 0.3%).
    uint32_t retained_multiplier() const noexcept { return denominator_ - numerator_; }

    bool operator==(const FeeRate&) const = default;

private:
    uint32_t numerator_;
    uint32_t denominator_;
};

} // namespace amm::domain
