#pragma once

#include "domain/events/PoolEvent.hpp"
#include "domain/value_objects/Account.hpp"
#include "domain/value_objects/Amount.hpp"
#include "domain/value_objects/PairKey.hpp"

namespace amm::domain {

struct PairCreated : PoolEvent {
    PairKey key;
    Account creator;
    Amount reserve_low;
    Amount reserve_high;
};

} // namespace amm::domain
