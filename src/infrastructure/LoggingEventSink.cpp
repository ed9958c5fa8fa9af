#include "infrastructure/LoggingEventSink.hpp"

namespace amm::infrastructure {

LoggingEventSink::LoggingEventSink(std::ostream& out) : out_(out) {}

void LoggingEventSink::asset_registered(const amm::domain::AssetRegistered& event) noexcept {
    out_ << "[pool] #" << event.sequence_number
         << " registered " << event.asset.id() << std::endl;
}

void LoggingEventSink::pair_created(const amm::domain::PairCreated& event) noexcept {
    out_ << "[pool] #" << event.sequence_number
         << " created " << event.key.to_string()
         << " reserves=" << event.reserve_low << "/" << event.reserve_high
         << " creator=" << event.creator.id() << std::endl;
}

void LoggingEventSink::swap_executed(const amm::domain::SwapExecuted& event) noexcept {
    out_ << "[swap] #" << event.sequence_number
         << " caller=" << event.caller.id()
         << " " << event.key.to_string()
         << " in_low=" << event.amount_low_in
         << " in_high=" << event.amount_high_in
         << " out_low=" << event.amount_low_out
         << " out_high=" << event.amount_high_out << std::endl;
}

} // namespace amm::infrastructure
