#pragma once

#include "domain/events/AssetRegistered.hpp"
#include "domain/events/PairCreated.hpp"
#include "domain/events/SwapExecuted.hpp"

namespace amm::services {

// Fire-and-forget notifications, delivered after the state change is committed.
class IEventSink {
public:
    virtual void asset_registered(const amm::domain::AssetRegistered& event) noexcept = 0;
    virtual void pair_created(const amm::domain::PairCreated& event) noexcept = 0;
    virtual void swap_executed(const amm::domain::SwapExecuted& event) noexcept = 0;
    virtual ~IEventSink() = default;
};

} // namespace amm::services
