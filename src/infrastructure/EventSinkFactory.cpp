#include "infrastructure/EventSinkFactory.hpp"

#include "infrastructure/JsonEventSink.hpp"
#include "infrastructure/LoggingEventSink.hpp"

#include <stdexcept>

namespace amm::infrastructure {

std::unique_ptr<amm::services::IEventSink> make_event_sink(
    const amm::config::EventSettings& settings, std::ostream& out) {
    if (settings.format == "log") {
        return std::make_unique<LoggingEventSink>(out);
    }
    if (settings.format == "json") {
        return std::make_unique<JsonEventSink>(out);
    }
    throw std::invalid_argument("Unknown event format: " + settings.format);
}

} // namespace amm::infrastructure
