#pragma once

#include <cstdint>

#include "database.hpp"
#include "error.hpp"
#include "host.hpp"
#include "suits.hpp"
#include "types.hpp"
#include "wallet.hpp"

// Smallest accepted tip, in minor units.
constexpr int64_t MIN_TIP_AMOUNT = 1'000'000;

// Per-creator escrow of received tips.
class TippingLedger
{
public:
    TippingLedger(DatabaseInterface& db, HostInterface& host,
                  SuitCountersInterface& suits, Wallet& wallet);

    // The balance of “owner”, created empty on first use. Anybody may
    // call this, typically a tipper preparing the creator’s balance.
    E<ObjectID> getOrCreateBalance(const Address& owner);
    // Merge the whole of “payment” into the balance of the suit’s
    // creator.
    E<void> tipPost(const Address& caller, const ObjectID& suit,
                    const ObjectID& balance, const ObjectID& payment);
    // Move “amount” out of the caller’s balance into a new coin owned
    // by the caller.
    E<Coin> withdraw(const Address& caller, const ObjectID& balance,
                     int64_t amount);

    E<TipBalance> getBalance(const ObjectID& id);
    E<TipBalance> getBalanceOf(const Address& owner);

private:
    DatabaseInterface& db;
    HostInterface& host;
    SuitCountersInterface& suits;
    Wallet& wallet;
};
