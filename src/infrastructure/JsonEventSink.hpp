#pragma once

#include "domain/events/PoolEventVariant.hpp"
#include "services/IEventSink.hpp"

#include <nlohmann/json.hpp>

#include <ostream>

namespace amm::infrastructure {

// JSON-lines event stream. Amounts are encoded as decimal strings since they
// exceed the range of JSON numbers.
class JsonEventSink : public amm::services::IEventSink {
public:
    explicit JsonEventSink(std::ostream& out);

    void asset_registered(const amm::domain::AssetRegistered& event) noexcept override;
    void pair_created(const amm::domain::PairCreated& event) noexcept override;
    void swap_executed(const amm::domain::SwapExecuted& event) noexcept override;

    static nlohmann::json to_json(const amm::domain::PoolEventVariant& event);

private:
    void write(const nlohmann::json& obj) noexcept;

    std::ostream& out_;
};

} // namespace amm::infrastructure
