#include "infrastructure/JsonEventSink.hpp"

#include <type_traits>
#include <variant>

using json = nlohmann::json;
using namespace amm::domain;

namespace amm::infrastructure {

JsonEventSink::JsonEventSink(std::ostream& out) : out_(out) {}

void JsonEventSink::asset_registered(const AssetRegistered& event) noexcept {
    write(to_json(event));
}

void JsonEventSink::pair_created(const PairCreated& event) noexcept {
    write(to_json(event));
}

void JsonEventSink::swap_executed(const SwapExecuted& event) noexcept {
    write(to_json(event));
}

json JsonEventSink::to_json(const PoolEventVariant& event) {
    return std::visit([](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;
        json obj;
        obj["sequence_number"] = e.sequence_number;
        if constexpr (std::is_same_v<T, AssetRegistered>) {
            obj["event"] = "asset_registered";
            obj["asset"] = e.asset.id();
        } else if constexpr (std::is_same_v<T, PairCreated>) {
            obj["event"] = "pair_created";
            obj["asset_low"] = e.key.low().id();
            obj["asset_high"] = e.key.high().id();
            obj["creator"] = e.creator.id();
            obj["reserve_low"] = e.reserve_low.to_string();
            obj["reserve_high"] = e.reserve_high.to_string();
        } else if constexpr (std::is_same_v<T, SwapExecuted>) {
            obj["event"] = "swap_executed";
            obj["asset_low"] = e.key.low().id();
            obj["asset_high"] = e.key.high().id();
            obj["caller"] = e.caller.id();
            obj["amount_low_in"] = e.amount_low_in.to_string();
            obj["amount_high_in"] = e.amount_high_in.to_string();
            obj["amount_low_out"] = e.amount_low_out.to_string();
            obj["amount_high_out"] = e.amount_high_out.to_string();
        }
        return obj;
    }, event);
}

void JsonEventSink::write(const json& obj) noexcept {
    // Invalid UTF-8 in ids is replaced rather than thrown
    out_ << obj.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
}

} // namespace amm::infrastructure
