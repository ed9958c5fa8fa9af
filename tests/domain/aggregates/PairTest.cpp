#include "domain/aggregates/Pair.hpp"

#include "domain/errors/PoolError.hpp"

#include <gtest/gtest.h>

using namespace amm::domain;

class PairTest : public ::testing::Test {
protected:
    Asset x{"X"};
    Asset y{"Y"};
    PairKey key = PairKey::of(x, y);

    Pair make_pair(uint64_t low = 1000, uint64_t high = 2000) {
        return Pair::create(key, Amount(low), Amount(high));
    }
};

TEST_F(PairTest, CreatesWithPositiveReserves) {
    auto pair = make_pair();
    EXPECT_EQ(pair.key(), key);
    EXPECT_EQ(pair.asset_low(), x);
    EXPECT_EQ(pair.asset_high(), y);
    EXPECT_EQ(pair.reserve_low(), Amount(1000));
    EXPECT_EQ(pair.reserve_high(), Amount(2000));
}

TEST_F(PairTest, ThrowsOnEmptyReserve) {
    try {
        Pair::create(key, Amount(1000), Amount::zero());
        FAIL() << "expected PoolError";
    } catch (const PoolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InsufficientLiquidity);
    }
    EXPECT_THROW(Pair::create(key, Amount::zero(), Amount(1)), PoolError);
}

TEST_F(PairTest, ReserveOfLooksUpByAsset) {
    auto pair = make_pair();
    EXPECT_EQ(pair.reserve_of(x), Amount(1000));
    EXPECT_EQ(pair.reserve_of(y), Amount(2000));
    EXPECT_THROW(pair.reserve_of(Asset("Z")), std::out_of_range);
}

TEST_F(PairTest, InvariantProductMultipliesReserves) {
    auto pair = make_pair();
    EXPECT_EQ(pair.invariant_product(), uint512(2000000));
}

TEST_F(PairTest, InvariantProductDoesNotWrap) {
    auto max = Amount::from_string(
        "115792089237316195423570985008687907853269984665640564039457584007913129639935");
    auto pair = Pair::create(key, max, max);
    uint512 expected = uint512(max.value()) * uint512(max.value());
    EXPECT_EQ(pair.invariant_product(), expected);
}

TEST_F(PairTest, ApplySwapFromLowSide) {
    auto pair = make_pair();
    auto next = pair.apply_swap(x, Amount(100), Amount(181));

    EXPECT_EQ(next.reserve_low(), Amount(1100));
    EXPECT_EQ(next.reserve_high(), Amount(1819));
    // Original is unchanged
    EXPECT_EQ(pair.reserve_low(), Amount(1000));
    EXPECT_EQ(pair.reserve_high(), Amount(2000));
}

TEST_F(PairTest, ApplySwapFromHighSide) {
    auto next = make_pair().apply_swap(y, Amount(200), Amount(90));
    EXPECT_EQ(next.reserve_low(), Amount(910));
    EXPECT_EQ(next.reserve_high(), Amount(2200));
}

TEST_F(PairTest, ApplySwapRejectsDecreasingProduct) {
    // 1100 * 1700 < 1000 * 2000
    EXPECT_THROW(make_pair().apply_swap(x, Amount(100), Amount(300)), std::logic_error);
}

TEST_F(PairTest, ApplySwapRejectsForeignAsset) {
    EXPECT_THROW(make_pair().apply_swap(Asset("Z"), Amount(1), Amount(1)), std::out_of_range);
}

TEST_F(PairTest, ApplyEventMatchesApplySwap) {
    auto pair = make_pair();
    SwapExecuted event{{3}, key, Account("alice"),
                       Amount(100), Amount::zero(), Amount::zero(), Amount(181)};

    EXPECT_EQ(pair.apply(event), pair.apply_swap(x, Amount(100), Amount(181)));
}

TEST_F(PairTest, ApplyEventRejectsOtherPair) {
    SwapExecuted event{{3}, PairKey::of(x, Asset("Z")), Account("alice"),
                       Amount(100), Amount::zero(), Amount::zero(), Amount(10)};
    EXPECT_THROW(make_pair().apply(event), std::invalid_argument);
}
