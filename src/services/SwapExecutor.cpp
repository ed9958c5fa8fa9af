#include "services/SwapExecutor.hpp"

#include "domain/errors/PoolError.hpp"
#include "domain/pricing/PricingEngine.hpp"
#include "services/LedgerTransaction.hpp"

#include <exception>

using namespace amm::domain;

namespace amm::services {

SwapExecutor::SwapExecutor(PairStore& store,
                           ITokenLedger& ledger,
                           IEventSink& sink,
                           Account custody,
                           FeeRate fee)
    : store_(store)
    , ledger_(ledger)
    , sink_(sink)
    , custody_(std::move(custody))
    , fee_(fee) {}

void SwapExecutor::register_asset(const Asset& asset) {
    ReentrancyGuard::Scope scope(guard_);

    if (store_.is_registered(asset)) {
        throw PoolError(ErrorCode::DuplicateAsset, asset.id() + " is already registered");
    }
    if (query_supply(asset).is_zero()) {
        throw PoolError(ErrorCode::InvalidAsset, asset.id() + " has no issued supply");
    }

    auto event = store_.register_asset(asset);
    sink_.asset_registered(event);
}

void SwapExecutor::create_pair(const Account& caller,
                               const Asset& asset_a, const Asset& asset_b,
                               const Amount& amount_a, const Amount& amount_b) {
    ReentrancyGuard::Scope scope(guard_);

    auto pair = store_.prepare_pair(asset_a, asset_b, amount_a, amount_b);

    LedgerTransaction tx(ledger_, custody_);
    tx.pull(asset_a, caller, amount_a);
    tx.pull(asset_b, caller, amount_b);
    auto event = store_.record_pair(pair, caller);
    tx.commit();

    sink_.pair_created(event);
}

Amount SwapExecutor::swap(const Account& caller,
                          const Asset& asset_in,
                          const Asset& asset_out,
                          const Amount& amount_in) {
    ReentrancyGuard::Scope scope(guard_);

    // Checks against the state observed at entry
    auto plan = plan_swap(asset_in, asset_out, amount_in);

    // Interactions; reversed by tx unless the commit below succeeds
    LedgerTransaction tx(ledger_, custody_);
    tx.pull(asset_in, caller, amount_in);
    tx.push(asset_out, caller, plan.amount_out);

    // Effects
    auto event = store_.record_swap(plan.updated, caller, asset_in, amount_in, plan.amount_out);
    tx.commit();

    sink_.swap_executed(event);
    return plan.amount_out;
}

Amount SwapExecutor::quote(const Asset& asset_in,
                           const Asset& asset_out,
                           const Amount& amount_in) const {
    auto lock = guard_.observe();
    return plan_swap(asset_in, asset_out, amount_in).amount_out;
}

Pair SwapExecutor::get_pair(const Asset& asset_a, const Asset& asset_b) const {
    auto lock = guard_.observe();
    return store_.lookup(asset_a, asset_b);
}

SwapExecutor::SwapPlan SwapExecutor::plan_swap(const Asset& asset_in,
                                               const Asset& asset_out,
                                               const Amount& amount_in) const {
    if (amount_in.is_zero()) {
        throw PoolError(ErrorCode::InsufficientInput, "swap input amount is zero");
    }
    if (asset_in == asset_out) {
        throw PoolError(ErrorCode::InvalidAssetPair, "cannot swap " + asset_in.id() + " for itself");
    }

    const auto& pair = store_.lookup(asset_in, asset_out);
    auto amount_out = PricingEngine::quote_output(
        amount_in, pair.reserve_of(asset_in), pair.reserve_of(asset_out), fee_);

    return SwapPlan{pair.apply_swap(asset_in, amount_in, amount_out), amount_out};
}

Amount SwapExecutor::query_supply(const Asset& asset) const {
    try {
        return ledger_.total_supply(asset);
    } catch (const PoolError& e) {
        if (e.category() == ErrorCategory::CONCURRENCY) throw;
        throw PoolError(ErrorCode::InvalidAsset, asset.id() + " supply query failed: " + e.what());
    } catch (const std::exception& e) {
        throw PoolError(ErrorCode::InvalidAsset, asset.id() + " supply query failed: " + e.what());
    }
}

} // namespace amm::services
