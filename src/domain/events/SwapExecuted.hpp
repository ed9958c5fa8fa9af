#pragma once

#include "domain/events/PoolEvent.hpp"
#include "domain/value_objects/Account.hpp"
#include "domain/value_objects/Amount.hpp"
#include "domain/value_objects/PairKey.hpp"

namespace amm::domain {

// Directional amounts relative to the canonical key; exactly one *_in and
// one *_out are nonzero.
struct SwapExecuted : PoolEvent {
    PairKey key;
    Account caller;
    Amount amount_low_in;
    Amount amount_high_in;
    Amount amount_low_out;
    Amount amount_high_out;
};

} // namespace amm::domain
