#pragma once

#include "domain/aggregates/Pair.hpp"
#include "domain/aggregates/PoolSnapshot.hpp"
#include "domain/events/PoolEventVariant.hpp"
#include "repositories/IPoolRepository.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>

namespace amm::services {

// Single source of truth for registered assets and pool reserves. Keeps one
// record per unordered asset pair and writes every committed fact through to
// the repository before updating the in-memory projection.
class PairStore {
public:
    explicit PairStore(amm::repositories::IPoolRepository& repo,
                       uint64_t snapshot_interval = 1000);

    // Rebuild the projection from the latest snapshot plus later events
    void restore();

    // Assets
    bool is_registered(const amm::domain::Asset& asset) const;
    amm::domain::AssetRegistered register_asset(const amm::domain::Asset& asset);
    const std::set<amm::domain::Asset>& registered_assets() const noexcept { return assets_; }

    // Pairs
    static amm::domain::PairKey canonicalize(const amm::domain::Asset& a,
                                             const amm::domain::Asset& b);

    // Validates a new pool and orders the deposit by canonical side. No state change.
    amm::domain::Pair prepare_pair(const amm::domain::Asset& a, const amm::domain::Asset& b,
                                   const amm::domain::Amount& amount_a,
                                   const amm::domain::Amount& amount_b) const;
    amm::domain::PairCreated record_pair(const amm::domain::Pair& pair,
                                         const amm::domain::Account& creator);
    amm::domain::SwapExecuted record_swap(const amm::domain::Pair& updated,
                                          const amm::domain::Account& caller,
                                          const amm::domain::Asset& asset_in,
                                          const amm::domain::Amount& amount_in,
                                          const amm::domain::Amount& amount_out);

    const amm::domain::Pair& lookup(const amm::domain::Asset& a,
                                    const amm::domain::Asset& b) const;
    std::optional<amm::domain::Pair> find(const amm::domain::Asset& a,
                                          const amm::domain::Asset& b) const;

    size_t pair_count() const noexcept { return pairs_.size(); }
    uint64_t event_count() const noexcept { return next_sequence_number_ - 1; }
    amm::domain::PoolSnapshot snapshot() const;

private:
    void require_registered(const amm::domain::Asset& asset) const;
    static void apply(const amm::domain::PoolEventVariant& event,
                      std::set<amm::domain::Asset>& assets,
                      std::map<amm::domain::PairKey, amm::domain::Pair>& pairs);
    void advance();

    amm::repositories::IPoolRepository& repository_;
    std::set<amm::domain::Asset> assets_;
    std::map<amm::domain::PairKey, amm::domain::Pair> pairs_;
    uint64_t snapshot_interval_;
    uint64_t next_sequence_number_{1};
};

} // namespace amm::services
