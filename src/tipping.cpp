#include "tipping.hpp"

#include <format>
#include <limits>

#include <spdlog/spdlog.h>

#include "events.hpp"
#include "transaction.hpp"

TippingLedger::TippingLedger(DatabaseInterface& db, HostInterface& host,
                             SuitCountersInterface& suits, Wallet& wallet)
    : db(db), host(host), suits(suits), wallet(wallet)
{
}

E<ObjectID> TippingLedger::getOrCreateBalance(const Address& owner)
{
    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(auto existing, db.getBalanceIdByOwner(owner));
    if(existing.has_value())
    {
        DO_OR_RETURN(tx.commit());
        return *existing;
    }

    TipBalance b;
    ASSIGN_OR_RETURN(b.id, host.newObjectID());
    b.owner = owner;
    DO_OR_RETURN(db.createTipBalance(b));
    DO_OR_RETURN(db.registerBalance(owner, b.id));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("Created tip balance {} for {}", b.id.str(), owner.str());
    return b.id;
}

E<void> TippingLedger::tipPost(const Address& caller, const ObjectID& suit,
                               const ObjectID& balance,
                               const ObjectID& payment)
{
    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(Coin coin, wallet.getCoin(payment));
    if(coin.owner != caller)
    {
        return std::unexpected(ledgerError(
            Errc::NOT_OWNER,
            std::format("Coin {} is not yours", payment.str())));
    }
    if(coin.value < MIN_TIP_AMOUNT)
    {
        return std::unexpected(ledgerError(
            Errc::BELOW_MINIMUM_TIP,
            std::format("Tip of {} is below the minimum of {}", coin.value,
                        MIN_TIP_AMOUNT)));
    }
    ASSIGN_OR_RETURN(Address creator, suits.creatorOf(suit));
    if(creator == caller)
    {
        return std::unexpected(ledgerError(
            Errc::SELF_TIP, "Cannot tip your own suit"));
    }
    ASSIGN_OR_RETURN(TipBalance b, getBalance(balance));
    if(b.owner != creator)
    {
        return std::unexpected(ledgerError(
            Errc::BALANCE_OWNER_MISMATCH,
            std::format("Balance {} does not belong to the creator of {}",
                        balance.str(), suit.str())));
    }
    // balance <= total_received, so this bounds both.
    if(coin.value > std::numeric_limits<int64_t>::max() - b.total_received)
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_AMOUNT,
            std::format("Tip of {} would overflow balance {}", coin.value,
                        balance.str())));
    }

    ASSIGN_OR_RETURN(int64_t amount, wallet.consumeCoin(caller, payment));
    b.balance += amount;
    b.total_received += amount;
    DO_OR_RETURN(db.updateTipBalance(b));
    DO_OR_RETURN(suits.addTipAmount(suit, amount));
    DO_OR_RETURN(db.appendEvent(
        events::tipSent(suit, caller, creator, amount, host.nowMillis())));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("{} tipped {} on suit {}", caller.str(), amount, suit.str());
    return {};
}

E<Coin> TippingLedger::withdraw(const Address& caller, const ObjectID& balance,
                                int64_t amount)
{
    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(TipBalance b, getBalance(balance));
    if(b.owner != caller)
    {
        return std::unexpected(ledgerError(
            Errc::NOT_OWNER, "Only the owner may withdraw"));
    }
    if(b.balance == 0)
    {
        return std::unexpected(ledgerError(Errc::ZERO_BALANCE,
                                           "Balance is empty"));
    }
    if(amount > b.balance)
    {
        return std::unexpected(ledgerError(
            Errc::INSUFFICIENT_BALANCE,
            std::format("Cannot withdraw {} from a balance of {}", amount,
                        b.balance)));
    }
    if(amount <= 0)
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_AMOUNT, "Withdrawal amount must be positive"));
    }

    b.balance -= amount;
    b.total_withdrawn += amount;
    DO_OR_RETURN(db.updateTipBalance(b));
    ASSIGN_OR_RETURN(Coin coin, wallet.createCoin(caller, amount));
    DO_OR_RETURN(db.appendEvent(
        events::fundsWithdrawn(b, amount, host.nowMillis())));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("{} withdrew {} from balance {}", caller.str(), amount,
                  balance.str());
    return coin;
}

E<TipBalance> TippingLedger::getBalance(const ObjectID& id)
{
    ASSIGN_OR_RETURN(auto b, db.getTipBalanceById(id));
    if(!b.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND, std::format("Balance {} not found", id.str())));
    }
    return *b;
}

E<TipBalance> TippingLedger::getBalanceOf(const Address& owner)
{
    ASSIGN_OR_RETURN(auto id, db.getBalanceIdByOwner(owner));
    if(!id.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND,
            std::format("{} has no tip balance", owner.str())));
    }
    return getBalance(*id);
}
