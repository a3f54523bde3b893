#include <limits>

#include <gtest/gtest.h>

#include "ledger_fixture.hpp"
#include "test_utils.hpp"
#include "wallet.hpp"

using WalletTest = LedgerTest;

TEST_F(WalletTest, CanMint)
{
    ASSIGN_OR_FAIL(Coin c, ledger->wallet().mint(alice, 500));
    EXPECT_EQ(c.owner, alice);
    EXPECT_EQ(c.value, 500);
    ASSIGN_OR_FAIL(Coin stored, ledger->wallet().getCoin(c.id));
    EXPECT_EQ(stored.value, 500);
    EXPECT_ERRC(ledger->wallet().mint(alice, 0), Errc::INVALID_AMOUNT);
    EXPECT_ERRC(ledger->wallet().mint(alice, -5), Errc::INVALID_AMOUNT);
}

TEST_F(WalletTest, CanSplit)
{
    ASSIGN_OR_FAIL(Coin c, ledger->wallet().mint(alice, 500));
    ASSIGN_OR_FAIL(Coin part, ledger->wallet().split(alice, c.id, 200));
    EXPECT_EQ(part.value, 200);
    EXPECT_EQ(part.owner, alice);
    ASSIGN_OR_FAIL(Coin rest, ledger->wallet().getCoin(c.id));
    EXPECT_EQ(rest.value, 300);
    ASSIGN_OR_FAIL(int64_t total, ledger->wallet().totalValueOf(alice));
    EXPECT_EQ(total, 500);
    ASSIGN_OR_FAIL(auto coins, ledger->wallet().coinsOwnedBy(alice));
    EXPECT_EQ(coins.size(), 2u);
}

TEST_F(WalletTest, SplitMustLeaveBothCoinsNonEmpty)
{
    ASSIGN_OR_FAIL(Coin c, ledger->wallet().mint(alice, 500));
    EXPECT_ERRC(ledger->wallet().split(alice, c.id, 0), Errc::INVALID_AMOUNT);
    EXPECT_ERRC(ledger->wallet().split(alice, c.id, 500),
                Errc::INVALID_AMOUNT);
    EXPECT_ERRC(ledger->wallet().split(bob, c.id, 100), Errc::NOT_OWNER);
    ASSIGN_OR_FAIL(auto coins, ledger->wallet().coinsOwnedBy(alice));
    ASSERT_EQ(coins.size(), 1u);
    EXPECT_EQ(coins[0].value, 500);
}

TEST_F(WalletTest, UnknownCoin)
{
    ASSIGN_OR_FAIL(ObjectID missing, ObjectID::fromStr("0xdead"));
    EXPECT_ERRC(ledger->wallet().getCoin(missing), Errc::NOT_FOUND);
    ASSIGN_OR_FAIL(auto coins, ledger->wallet().coinsOwnedBy(bob));
    EXPECT_TRUE(coins.empty());
}

TEST_F(WalletTest, TotalValueDoesNotOverflow)
{
    ASSERT_TRUE(ledger->wallet().mint(alice,
                                      std::numeric_limits<int64_t>::max()));
    ASSIGN_OR_FAIL(int64_t total, ledger->wallet().totalValueOf(alice));
    EXPECT_EQ(total, std::numeric_limits<int64_t>::max());
    ASSERT_TRUE(ledger->wallet().mint(alice, 1));
    EXPECT_ERRC(ledger->wallet().totalValueOf(alice), Errc::INVALID_AMOUNT);
}
