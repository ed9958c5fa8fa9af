#include "services/PairStore.hpp"

#include "domain/errors/PoolError.hpp"
#include "repositories/InMemoryPoolRepository.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <variant>

using namespace amm::domain;
using namespace amm::services;
using amm::repositories::InMemoryPoolRepository;

// --- Test fake ---

class FlakyPoolRepository : public InMemoryPoolRepository {
public:
    bool fail_appends = false;
    bool fail_snapshots = false;

    void append_event(const PoolEventVariant& event) override {
        if (fail_appends) throw std::runtime_error("disk full");
        InMemoryPoolRepository::append_event(event);
    }

    void store_snapshot(const PoolSnapshot& snapshot) override {
        if (fail_snapshots) throw std::runtime_error("disk full");
        InMemoryPoolRepository::store_snapshot(snapshot);
    }
};

// --- Fixture ---

class PairStoreTest : public ::testing::Test {
protected:
    FlakyPoolRepository repo;
    Asset x{"X"};
    Asset y{"Y"};
    Asset z{"Z"};
    Account alice{"alice"};

    void register_all(PairStore& store) {
        store.register_asset(x);
        store.register_asset(y);
        store.register_asset(z);
    }

    ErrorCode prepare_error(PairStore& store, const Asset& a, const Asset& b,
                            uint64_t amount_a, uint64_t amount_b) {
        try {
            store.prepare_pair(a, b, Amount(amount_a), Amount(amount_b));
        } catch (const PoolError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected PoolError";
        return ErrorCode::InvalidAsset;
    }
};

// --- Assets ---

TEST_F(PairStoreTest, RegistersAssetOnce) {
    PairStore store(repo);

    auto event = store.register_asset(x);
    EXPECT_EQ(event.sequence_number, 1u);
    EXPECT_EQ(event.asset, x);
    EXPECT_TRUE(store.is_registered(x));
    EXPECT_FALSE(store.is_registered(y));

    EXPECT_THROW(store.register_asset(x), PoolError);
    EXPECT_EQ(repo.event_count(), 1u);
    EXPECT_EQ(store.registered_assets().size(), 1u);
}

// --- Pairs ---

TEST_F(PairStoreTest, CanonicalizeIsOrderInsensitive) {
    EXPECT_EQ(PairStore::canonicalize(x, y), PairStore::canonicalize(y, x));
    EXPECT_THROW(PairStore::canonicalize(x, x), PoolError);
}

TEST_F(PairStoreTest, PrepareOrdersDepositByCanonicalSide) {
    PairStore store(repo);
    register_all(store);

    auto pair = store.prepare_pair(y, x, Amount(2000), Amount(1000));
    EXPECT_EQ(pair.asset_low(), x);
    EXPECT_EQ(pair.reserve_low(), Amount(1000));
    EXPECT_EQ(pair.reserve_high(), Amount(2000));

    // Nothing recorded yet
    EXPECT_EQ(store.pair_count(), 0u);
}

TEST_F(PairStoreTest, PrepareValidatesInOrder) {
    PairStore store(repo);
    store.register_asset(x);

    EXPECT_EQ(prepare_error(store, x, x, 0, 0), ErrorCode::IdenticalAssets);
    EXPECT_EQ(prepare_error(store, x, y, 0, 0), ErrorCode::AssetNotRegistered);

    store.register_asset(y);
    EXPECT_EQ(prepare_error(store, x, y, 0, 10), ErrorCode::InsufficientLiquidity);
    EXPECT_EQ(prepare_error(store, x, y, 10, 0), ErrorCode::InsufficientLiquidity);

    store.record_pair(store.prepare_pair(x, y, Amount(10), Amount(10)), alice);
    EXPECT_EQ(prepare_error(store, y, x, 0, 0), ErrorCode::PairAlreadyExists);
}

TEST_F(PairStoreTest, RecordPairPersistsAndProjects) {
    PairStore store(repo);
    register_all(store);

    auto event = store.record_pair(store.prepare_pair(x, y, Amount(1000), Amount(2000)), alice);

    EXPECT_EQ(event.sequence_number, 4u);
    EXPECT_EQ(event.key, PairKey::of(x, y));
    EXPECT_EQ(event.creator, alice);
    EXPECT_EQ(repo.event_count(), 4u);
    EXPECT_TRUE(std::holds_alternative<PairCreated>(repo.events().back()));

    EXPECT_EQ(store.lookup(y, x).reserve_high(), Amount(2000));
    EXPECT_TRUE(store.find(x, y).has_value());
    EXPECT_FALSE(store.find(x, z).has_value());
}

TEST_F(PairStoreTest, LookupOfMissingPairThrows) {
    PairStore store(repo);
    register_all(store);

    try {
        store.lookup(x, z);
        FAIL() << "expected PoolError";
    } catch (const PoolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PairNotFound);
    }
}

TEST_F(PairStoreTest, RecordSwapBuildsDirectionalEvent) {
    PairStore store(repo);
    register_all(store);
    store.record_pair(store.prepare_pair(x, y, Amount(1000), Amount(2000)), alice);

    auto updated = store.lookup(x, y).apply_swap(y, Amount(200), Amount(90));
    auto event = store.record_swap(updated, alice, y, Amount(200), Amount(90));

    EXPECT_EQ(event.amount_low_in, Amount::zero());
    EXPECT_EQ(event.amount_high_in, Amount(200));
    EXPECT_EQ(event.amount_low_out, Amount(90));
    EXPECT_EQ(event.amount_high_out, Amount::zero());
    EXPECT_EQ(store.lookup(x, y), updated);
}

TEST_F(PairStoreTest, RecordSwapRejectsMismatchedReserves) {
    PairStore store(repo);
    register_all(store);
    store.record_pair(store.prepare_pair(x, y, Amount(1000), Amount(2000)), alice);

    auto updated = store.lookup(x, y).apply_swap(x, Amount(100), Amount(181));
    EXPECT_THROW(store.record_swap(updated, alice, x, Amount(100), Amount(180)), std::logic_error);
    EXPECT_EQ(store.lookup(x, y).reserve_low(), Amount(1000));
}

TEST_F(PairStoreTest, RejectedAppendLeavesProjectionUnchanged) {
    PairStore store(repo);
    register_all(store);
    store.record_pair(store.prepare_pair(x, y, Amount(1000), Amount(2000)), alice);

    repo.fail_appends = true;
    auto updated = store.lookup(x, y).apply_swap(x, Amount(100), Amount(181));

    EXPECT_THROW(store.record_swap(updated, alice, x, Amount(100), Amount(181)),
                 std::runtime_error);
    EXPECT_THROW(store.register_asset(Asset("W")), std::runtime_error);

    EXPECT_EQ(store.lookup(x, y).reserve_low(), Amount(1000));
    EXPECT_FALSE(store.is_registered(Asset("W")));
    EXPECT_EQ(store.event_count(), 4u);

    // The sequence is not consumed by a failed append
    repo.fail_appends = false;
    EXPECT_EQ(store.register_asset(Asset("W")).sequence_number, 5u);
}

// --- Snapshots ---

TEST_F(PairStoreTest, SnapshotsAtInterval) {
    PairStore store(repo, 2);

    store.register_asset(x);
    EXPECT_FALSE(repo.has_snapshot());

    store.register_asset(y);
    ASSERT_TRUE(repo.has_snapshot());
    EXPECT_EQ(repo.get_latest_snapshot()->last_sequence_number, 2u);
    EXPECT_EQ(repo.get_latest_snapshot()->assets.size(), 2u);

    store.register_asset(z);
    store.record_pair(store.prepare_pair(x, y, Amount(1000), Amount(2000)), alice);
    EXPECT_EQ(repo.snapshot_count(), 2u);
    EXPECT_EQ(repo.get_latest_snapshot()->pairs.size(), 1u);
}

TEST_F(PairStoreTest, ZeroIntervalDisablesSnapshots) {
    PairStore store(repo, 0);
    register_all(store);
    EXPECT_FALSE(repo.has_snapshot());
}

TEST_F(PairStoreTest, FailedSnapshotDoesNotFailCommit) {
    PairStore store(repo, 1);
    repo.fail_snapshots = true;

    EXPECT_NO_THROW(store.register_asset(x));
    EXPECT_TRUE(store.is_registered(x));
    EXPECT_EQ(repo.event_count(), 1u);
    EXPECT_FALSE(repo.has_snapshot());
}

// --- Restore ---

TEST_F(PairStoreTest, RestoresFromEventsOnly) {
    {
        PairStore store(repo, 0);
        register_all(store);
        store.record_pair(store.prepare_pair(x, y, Amount(1000), Amount(2000)), alice);
        auto updated = store.lookup(x, y).apply_swap(x, Amount(100), Amount(181));
        store.record_swap(updated, alice, x, Amount(100), Amount(181));
    }

    PairStore restored(repo, 0);
    restored.restore();

    EXPECT_EQ(restored.event_count(), 5u);
    EXPECT_EQ(restored.registered_assets().size(), 3u);
    EXPECT_EQ(restored.lookup(x, y).reserve_low(), Amount(1100));
    EXPECT_EQ(restored.lookup(x, y).reserve_high(), Amount(1819));
}

TEST_F(PairStoreTest, RestoresFromSnapshotPlusReplay) {
    {
        PairStore store(repo, 4);
        register_all(store);
        store.record_pair(store.prepare_pair(x, y, Amount(1000), Amount(2000)), alice);
        auto updated = store.lookup(x, y).apply_swap(y, Amount(200), Amount(90));
        store.record_swap(updated, alice, y, Amount(200), Amount(90));
    }
    ASSERT_EQ(repo.get_latest_snapshot()->last_sequence_number, 4u);

    PairStore restored(repo, 4);
    restored.restore();

    EXPECT_EQ(restored.event_count(), 5u);
    EXPECT_EQ(restored.lookup(x, y).reserve_low(), Amount(910));
    EXPECT_EQ(restored.lookup(x, y).reserve_high(), Amount(2200));

    // New events continue the sequence
    EXPECT_EQ(restored.register_asset(Asset("W")).sequence_number, 6u);
}

TEST_F(PairStoreTest, RestoreRejectsSequenceGap) {
    repo.append_event(AssetRegistered{{1}, x});
    repo.append_event(AssetRegistered{{3}, y});

    PairStore store(repo);
    EXPECT_THROW(store.restore(), std::runtime_error);
}

TEST_F(PairStoreTest, FailedRestoreLeavesProjectionUntouched) {
    PairStore store(repo);
    store.register_asset(x);
    store.register_asset(y);
    repo.append_event(AssetRegistered{{4}, z});

    EXPECT_THROW(store.restore(), std::runtime_error);

    EXPECT_EQ(store.event_count(), 2u);
    EXPECT_EQ(store.registered_assets().size(), 2u);
    EXPECT_FALSE(store.is_registered(z));

    // Sequencing continues from the last event this store committed
    EXPECT_EQ(store.register_asset(Asset("W")).sequence_number, 3u);
}

TEST_F(PairStoreTest, FailedReplayOfUnknownPairKeepsPairs) {
    PairStore store(repo);
    register_all(store);
    store.record_pair(store.prepare_pair(x, y, Amount(1000), Amount(2000)), alice);
    repo.append_event(SwapExecuted{{5}, PairKey::of(x, z), alice,
                                   Amount(10), Amount::zero(), Amount::zero(), Amount(9)});

    EXPECT_THROW(store.restore(), std::runtime_error);

    EXPECT_EQ(store.event_count(), 4u);
    EXPECT_EQ(store.pair_count(), 1u);
    EXPECT_EQ(store.lookup(x, y).reserve_low(), Amount(1000));
}
