#include "domain/value_objects/Account.hpp"

#include <gtest/gtest.h>

using amm::domain::Account;

TEST(Account, StoresId) {
    Account a("alice");
    EXPECT_EQ(a.id(), "alice");
}

TEST(Account, ThrowsOnEmptyId) {
    EXPECT_THROW(Account(""), std::invalid_argument);
}

TEST(Account, ComparesById) {
    EXPECT_EQ(Account("alice"), Account("alice"));
    EXPECT_NE(Account("alice"), Account("bob"));
    EXPECT_LT(Account("alice"), Account("bob"));
}
