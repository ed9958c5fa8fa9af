#pragma once

#include "domain/events/AssetRegistered.hpp"
#include "domain/events/PairCreated.hpp"
#include "domain/events/SwapExecuted.hpp"

#include <variant>

namespace amm::domain {

using PoolEventVariant = std::variant<AssetRegistered, PairCreated, SwapExecuted>;

inline uint64_t sequence_number_of(const PoolEventVariant& event) {
    return std::visit([](const auto& e) { return e.sequence_number; }, event);
}

} // namespace amm::domain
