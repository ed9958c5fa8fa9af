#pragma once

#include "domain/aggregates/PoolSnapshot.hpp"
#include "domain/events/PoolEventVariant.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace amm::repositories {

class IPoolRepository {
public:
    // Event storage (source of truth)
    virtual void append_event(const amm::domain::PoolEventVariant& event) = 0;
    virtual std::vector<amm::domain::PoolEventVariant> get_events_since(
        uint64_t sequence_number) const = 0;

    // Snapshot storage (checkpoint for fast restore)
    virtual void store_snapshot(const amm::domain::PoolSnapshot& snapshot) = 0;
    virtual std::optional<amm::domain::PoolSnapshot> get_latest_snapshot() const = 0;

    virtual ~IPoolRepository() = default;
};

} // namespace amm::repositories
