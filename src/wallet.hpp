#pragma once

#include <cstdint>
#include <vector>

#include "database.hpp"
#include "error.hpp"
#include "host.hpp"
#include "types.hpp"

// Coins of the native currency. On a real chain these belong to the
// host; here they live next to everything else so that tips and
// withdrawals commit together with the balances they touch.
class Wallet
{
public:
    Wallet(DatabaseInterface& db, HostInterface& host);

    // Create a coin out of nothing. For local chains and tests.
    E<Coin> mint(const Address& owner, int64_t value);
    // Take “amount” off “coin” into a new coin with the same owner.
    E<Coin> split(const Address& caller, const ObjectID& coin, int64_t amount);
    E<Coin> getCoin(const ObjectID& id);
    E<std::vector<Coin>> coinsOwnedBy(const Address& owner);
    E<int64_t> totalValueOf(const Address& owner);

    // Building blocks for other ledgers. These run inside the
    // caller’s transaction.
    E<Coin> createCoin(const Address& owner, int64_t value);
    // Take a coin away from “caller”, returning its value.
    E<int64_t> consumeCoin(const Address& caller, const ObjectID& coin);

private:
    DatabaseInterface& db;
    HostInterface& host;
};
