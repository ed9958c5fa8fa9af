#include "services/PairStore.hpp"

#include "domain/errors/PoolError.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

using namespace amm::domain;

namespace amm::services {

PairStore::PairStore(amm::repositories::IPoolRepository& repo, uint64_t snapshot_interval)
    : repository_(repo)
    , snapshot_interval_(snapshot_interval) {}

void PairStore::restore() {
    // Rebuilt aside; the live projection is only replaced once replay succeeds.
    std::set<Asset> assets;
    std::map<PairKey, Pair> pairs;

    uint64_t last = 0;
    if (auto snap = repository_.get_latest_snapshot()) {
        assets.insert(snap->assets.begin(), snap->assets.end());
        for (const auto& pair : snap->pairs) {
            pairs.emplace(pair.key(), pair);
        }
        last = snap->last_sequence_number;
    }

    for (const auto& event : repository_.get_events_since(last)) {
        auto seq = sequence_number_of(event);
        if (seq != last + 1) {
            throw std::runtime_error("Event log gap: expected #" + std::to_string(last + 1)
                                     + ", found #" + std::to_string(seq));
        }
        apply(event, assets, pairs);
        last = seq;
    }

    assets_.swap(assets);
    pairs_.swap(pairs);
    next_sequence_number_ = last + 1;
}

bool PairStore::is_registered(const Asset& asset) const {
    return assets_.count(asset) > 0;
}

AssetRegistered PairStore::register_asset(const Asset& asset) {
    if (is_registered(asset)) {
        throw PoolError(ErrorCode::DuplicateAsset, asset.id() + " is already registered");
    }

    AssetRegistered event{{next_sequence_number_}, asset};
    repository_.append_event(event);
    assets_.insert(asset);
    advance();
    return event;
}

PairKey PairStore::canonicalize(const Asset& a, const Asset& b) {
    return PairKey::of(a, b);
}

Pair PairStore::prepare_pair(const Asset& a, const Asset& b,
                             const Amount& amount_a, const Amount& amount_b) const {
    auto key = canonicalize(a, b);
    require_registered(a);
    require_registered(b);
    if (pairs_.count(key) > 0) {
        throw PoolError(ErrorCode::PairAlreadyExists, key.to_string());
    }
    if (amount_a.is_zero() || amount_b.is_zero()) {
        throw PoolError(ErrorCode::InsufficientLiquidity,
                        "initial deposit for " + key.to_string() + " must be positive on both sides");
    }

    return key.is_low(a) ? Pair::create(key, amount_a, amount_b)
                         : Pair::create(key, amount_b, amount_a);
}

PairCreated PairStore::record_pair(const Pair& pair, const Account& creator) {
    if (pairs_.count(pair.key()) > 0) {
        throw PoolError(ErrorCode::PairAlreadyExists, pair.key().to_string());
    }

    PairCreated event{{next_sequence_number_}, pair.key(), creator,
                      pair.reserve_low(), pair.reserve_high()};
    repository_.append_event(event);
    pairs_.emplace(pair.key(), pair);
    advance();
    return event;
}

SwapExecuted PairStore::record_swap(const Pair& updated, const Account& caller,
                                    const Asset& asset_in, const Amount& amount_in,
                                    const Amount& amount_out) {
    auto it = pairs_.find(updated.key());
    if (it == pairs_.end()) {
        throw PoolError(ErrorCode::PairNotFound, updated.key().to_string());
    }

    const bool in_is_low = updated.key().is_low(asset_in);
    SwapExecuted event{
        {next_sequence_number_}, updated.key(), caller,
        in_is_low ? amount_in : Amount::zero(),
        in_is_low ? Amount::zero() : amount_in,
        in_is_low ? Amount::zero() : amount_out,
        in_is_low ? amount_out : Amount::zero(),
    };

    // Replaying the event must reproduce the caller's view of the new reserves
    auto next = it->second.apply(event);
    if (!(next == updated)) {
        throw std::logic_error("Swap on " + updated.key().to_string()
                               + " does not match the stored reserves");
    }

    repository_.append_event(event);
    it->second = next;
    advance();
    return event;
}

const Pair& PairStore::lookup(const Asset& a, const Asset& b) const {
    auto key = canonicalize(a, b);
    auto it = pairs_.find(key);
    if (it == pairs_.end()) {
        throw PoolError(ErrorCode::PairNotFound, key.to_string());
    }
    return it->second;
}

std::optional<Pair> PairStore::find(const Asset& a, const Asset& b) const {
    auto it = pairs_.find(canonicalize(a, b));
    if (it != pairs_.end()) return it->second;
    return std::nullopt;
}

PoolSnapshot PairStore::snapshot() const {
    PoolSnapshot snap{event_count(), std::vector<Asset>(assets_.begin(), assets_.end()), {}};
    snap.pairs.reserve(pairs_.size());
    for (const auto& [key, pair] : pairs_) {
        snap.pairs.push_back(pair);
    }
    return snap;
}

void PairStore::require_registered(const Asset& asset) const {
    if (!is_registered(asset)) {
        throw PoolError(ErrorCode::AssetNotRegistered, asset.id());
    }
}

void PairStore::apply(const PoolEventVariant& event, std::set<Asset>& assets,
                      std::map<PairKey, Pair>& pairs) {
    std::visit([&](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, AssetRegistered>) {
            assets.insert(e.asset);
        } else if constexpr (std::is_same_v<T, PairCreated>) {
            pairs.emplace(e.key, Pair::create(e.key, e.reserve_low, e.reserve_high));
        } else if constexpr (std::is_same_v<T, SwapExecuted>) {
            auto it = pairs.find(e.key);
            if (it == pairs.end()) {
                throw std::runtime_error("Swap #" + std::to_string(e.sequence_number)
                                         + " references unknown pair " + e.key.to_string());
            }
            it->second = it->second.apply(e);
        }
    }, event);
}

void PairStore::advance() {
    uint64_t committed = next_sequence_number_++;
    if (snapshot_interval_ == 0 || committed % snapshot_interval_ != 0) return;

    // The event is already durable; a missed checkpoint only lengthens the next replay.
    try {
        repository_.store_snapshot(snapshot());
    } catch (const std::exception& e) {
        std::cerr << "[store] Snapshot at #" << committed << " failed: " << e.what() << std::endl;
    }
}

} // namespace amm::services
