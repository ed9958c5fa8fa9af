#pragma once

#include "domain/aggregates/Pair.hpp"
#include "domain/value_objects/Account.hpp"
#include "domain/value_objects/Amount.hpp"
#include "domain/value_objects/Asset.hpp"
#include "domain/value_objects/FeeRate.hpp"
#include "services/IEventSink.hpp"
#include "services/ITokenLedger.hpp"
#include "services/PairStore.hpp"
#include "services/ReentrancyGuard.hpp"

namespace amm::services {

// Public operation surface of the pool engine. Each mutating call is atomic:
// it either applies every transfer and the reserve update, or none of them.
class SwapExecutor {
public:
    SwapExecutor(PairStore& store,
                 ITokenLedger& ledger,
                 IEventSink& sink,
                 amm::domain::Account custody,
                 amm::domain::FeeRate fee = amm::domain::FeeRate::standard());

    // State-mutating operations (guarded)
    void register_asset(const amm::domain::Asset& asset);
    void create_pair(const amm::domain::Account& caller,
                     const amm::domain::Asset& asset_a, const amm::domain::Asset& asset_b,
                     const amm::domain::Amount& amount_a, const amm::domain::Amount& amount_b);
    amm::domain::Amount swap(const amm::domain::Account& caller,
                             const amm::domain::Asset& asset_in,
                             const amm::domain::Asset& asset_out,
                             const amm::domain::Amount& amount_in);

    // Queries against committed state
    amm::domain::Amount quote(const amm::domain::Asset& asset_in,
                              const amm::domain::Asset& asset_out,
                              const amm::domain::Amount& amount_in) const;
    amm::domain::Pair get_pair(const amm::domain::Asset& asset_a,
                               const amm::domain::Asset& asset_b) const;

private:
    struct SwapPlan {
        amm::domain::Pair updated;
        amm::domain::Amount amount_out;
    };

    SwapPlan plan_swap(const amm::domain::Asset& asset_in,
                       const amm::domain::Asset& asset_out,
                       const amm::domain::Amount& amount_in) const;
    amm::domain::Amount query_supply(const amm::domain::Asset& asset) const;

    PairStore& store_;
    ITokenLedger& ledger_;
    IEventSink& sink_;
    amm::domain::Account custody_;
    amm::domain::FeeRate fee_;
    ReentrancyGuard guard_;
};

} // namespace amm::services
