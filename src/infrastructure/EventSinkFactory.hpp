#pragma once

#include "config/Settings.hpp"
#include "services/IEventSink.hpp"

#include <memory>
#include <ostream>

namespace amm::infrastructure {

// "log" or "json"
std::unique_ptr<amm::services::IEventSink> make_event_sink(
    const amm::config::EventSettings& settings, std::ostream& out);

} // namespace amm::infrastructure
