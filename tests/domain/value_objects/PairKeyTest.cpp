#include "domain/value_objects/PairKey.hpp"

#include "domain/errors/PoolError.hpp"

#include <gtest/gtest.h>

using namespace amm::domain;

TEST(PairKey, OrdersAssetsLowToHigh) {
    auto key = PairKey::of(Asset("Y"), Asset("X"));
    EXPECT_EQ(key.low(), Asset("X"));
    EXPECT_EQ(key.high(), Asset("Y"));
}

TEST(PairKey, BothArgumentOrdersGiveSameKey) {
    EXPECT_EQ(PairKey::of(Asset("X"), Asset("Y")), PairKey::of(Asset("Y"), Asset("X")));
}

TEST(PairKey, ThrowsOnIdenticalAssets) {
    try {
        PairKey::of(Asset("X"), Asset("X"));
        FAIL() << "expected PoolError";
    } catch (const PoolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IdenticalAssets);
    }
}

TEST(PairKey, ContainsBothMembers) {
    auto key = PairKey::of(Asset("X"), Asset("Y"));
    EXPECT_TRUE(key.contains(Asset("X")));
    EXPECT_TRUE(key.contains(Asset("Y")));
    EXPECT_FALSE(key.contains(Asset("Z")));
    EXPECT_TRUE(key.is_low(Asset("X")));
    EXPECT_FALSE(key.is_low(Asset("Y")));
}

TEST(PairKey, FormatsAsLowSlashHigh) {
    EXPECT_EQ(PairKey::of(Asset("WETH"), Asset("DAI")).to_string(), "DAI/WETH");
}

TEST(PairKey, KeysAreOrdered) {
    EXPECT_LT(PairKey::of(Asset("A"), Asset("B")), PairKey::of(Asset("A"), Asset("C")));
}
