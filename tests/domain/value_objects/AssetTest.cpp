#include "domain/value_objects/Asset.hpp"

#include <gtest/gtest.h>

using amm::domain::Asset;

TEST(Asset, StoresId) {
    Asset a("USDC");
    EXPECT_EQ(a.id(), "USDC");
}

TEST(Asset, ThrowsOnEmptyId) {
    EXPECT_THROW(Asset(""), std::invalid_argument);
}

TEST(Asset, EqualIdsAreEqual) {
    EXPECT_EQ(Asset("WETH"), Asset("WETH"));
    EXPECT_NE(Asset("WETH"), Asset("DAI"));
}

TEST(Asset, OrdersLexicographically) {
    EXPECT_LT(Asset("DAI"), Asset("WETH"));
    EXPECT_LT(Asset("X"), Asset("Y"));
    EXPECT_FALSE(Asset("Y") < Asset("X"));
}
