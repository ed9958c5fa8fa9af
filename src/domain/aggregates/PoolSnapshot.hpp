#pragma once

#include "domain/aggregates/Pair.hpp"
#include "domain/value_objects/Asset.hpp"

#include <cstdint>
#include <vector>

namespace amm::domain {

// Checkpoint of the whole pool state after event last_sequence_number.
struct PoolSnapshot {
    uint64_t last_sequence_number;
    std::vector<Asset> assets;
    std::vector<Pair> pairs;
};

} // namespace amm::domain
