#pragma once

#include "domain/events/PoolEvent.hpp"
#include "domain/value_objects/Asset.hpp"

namespace amm::domain {

struct AssetRegistered : PoolEvent {
    Asset asset;
};

} // namespace amm::domain
