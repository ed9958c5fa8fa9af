#include "domain/pricing/PricingEngine.hpp"

#include "domain/errors/PoolError.hpp"

namespace amm::domain {

Amount PricingEngine::quote_output(const Amount& amount_in, const Amount& reserve_in,
                                   const Amount& reserve_out, const FeeRate& fee) {
    if (amount_in.is_zero()) {
        throw PoolError(ErrorCode::InsufficientInput, "input amount is zero");
    }
    if (reserve_in.is_zero() || reserve_out.is_zero()) {
        throw PoolError(ErrorCode::InsufficientLiquidity, "pool reserve is empty");
    }

    // 256-bit operands times a 32-bit multiplier stay well inside 512 bits.
    uint512 effective_in = uint512(amount_in.value()) * fee.retained_multiplier();
    uint512 numerator = effective_in * uint512(reserve_out.value());
    uint512 denominator = uint512(reserve_in.value()) * fee.denominator() + effective_in;
    uint512 out = numerator / denominator;

    if (out.is_zero()) {
        throw PoolError(ErrorCode::InsufficientOutput,
                        "input " + amount_in.to_string() + " yields no output");
    }
    if (out >= uint512(reserve_out.value())) {
        throw PoolError(ErrorCode::InsufficientLiquidity,
                        "output " + out.str() + " would drain reserve " + reserve_out.to_string());
    }
    return Amount(static_cast<uint256>(out));
}

Amount PricingEngine::quote_output(const Amount& amount_in, const Amount& reserve_in,
                                   const Amount& reserve_out,
                                   uint32_t fee_numerator, uint32_t fee_denominator) {
    return quote_output(amount_in, reserve_in, reserve_out,
                        FeeRate(fee_numerator, fee_denominator));
}

} // namespace amm::domain
