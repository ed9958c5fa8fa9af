#pragma once

#include <cstdint>

namespace amm::domain {

struct PoolEvent {
    uint64_t sequence_number;
};

} // namespace amm::domain
