#pragma once

#include "services/IEventSink.hpp"

#include <ostream>

namespace amm::infrastructure {

// One tagged line per pool event.
class LoggingEventSink : public amm::services::IEventSink {
public:
    explicit LoggingEventSink(std::ostream& out);

    void asset_registered(const amm::domain::AssetRegistered& event) noexcept override;
    void pair_created(const amm::domain::PairCreated& event) noexcept override;
    void swap_executed(const amm::domain::SwapExecuted& event) noexcept override;

private:
    std::ostream& out_;
};

} // namespace amm::infrastructure
