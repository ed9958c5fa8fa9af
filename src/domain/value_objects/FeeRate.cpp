#include "domain/value_objects/FeeRate.hpp"

#include <stdexcept>
#include <string>

namespace amm::domain {

FeeRate::FeeRate(uint32_t numerator, uint32_t denominator)
    : numerator_(numerator)
    , denominator_(denominator) {
    if (denominator_ == 0) {
        throw std::invalid_argument("FeeRate denominator must be positive");
    }
    if (numerator_ >= denominator_) {
        throw std::invalid_argument(
            "FeeRate must be below 100%, got: " + std::to_string(numerator_) + "/"
            + std::to_string(denominator_));
    }
}

FeeRate FeeRate::standard() {
    return FeeRate(3, 1000);
}

} // namespace amm::domain
