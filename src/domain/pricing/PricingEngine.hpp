#pragma once

#include "domain/value_objects/Amount.hpp"
#include "domain/value_objects/FeeRate.hpp"

#include <cstdint>

namespace amm::domain {

// Constant-product (x * y = k) pricing. Pure; integer-only.
class PricingEngine {
public:
    // Output for an exact input:
    //   effective_in = amount_in * (fee_denominator - fee_numerator)
    //   amount_out   = floor(effective_in * reserve_out /
    //                        (reserve_in * fee_denominator + effective_in))
    // Throws PoolError: InsufficientInput on zero input, InsufficientLiquidity
    // on an empty reserve, InsufficientOutput when the result rounds to zero.
    static Amount quote_output(const Amount& amount_in, const Amount& reserve_in,
                               const Amount& reserve_out, const FeeRate& fee);

    static Amount quote_output(const Amount& amount_in, const Amount& reserve_in,
                               const Amount& reserve_out,
                               uint32_t fee_numerator, uint32_t fee_denominator);
};

} // namespace amm::domain
