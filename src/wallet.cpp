#include "wallet.hpp"

#include <format>
#include <limits>

#include <spdlog/spdlog.h>

#include "transaction.hpp"

Wallet::Wallet(DatabaseInterface& db, HostInterface& host)
    : db(db), host(host)
{
}

E<Coin> Wallet::mint(const Address& owner, int64_t value)
{
    if(value <= 0)
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_AMOUNT, "Minted value must be positive"));
    }
    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(Coin c, createCoin(owner, value));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("Minted {} to {}", value, owner.str());
    return c;
}

E<Coin> Wallet::split(const Address& caller, const ObjectID& coin,
                      int64_t amount)
{
    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(Coin source, getCoin(coin));
    if(source.owner != caller)
    {
        return std::unexpected(ledgerError(
            Errc::NOT_OWNER, std::format("Coin {} is not yours", coin.str())));
    }
    if(amount <= 0 || amount >= source.value)
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_AMOUNT,
            std::format("Cannot split {} off a coin of {}", amount,
                        source.value)));
    }
    source.value -= amount;
    DO_OR_RETURN(db.updateCoin(source));
    ASSIGN_OR_RETURN(Coin c, createCoin(caller, amount));
    DO_OR_RETURN(tx.commit());
    return c;
}

E<Coin> Wallet::getCoin(const ObjectID& id)
{
    ASSIGN_OR_RETURN(auto c, db.getCoinById(id));
    if(!c.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND, std::format("Coin {} not found", id.str())));
    }
    return *c;
}

E<std::vector<Coin>> Wallet::coinsOwnedBy(const Address& owner)
{
    ASSIGN_OR_RETURN(auto coins, db.getCoinsByOwner(owner));
    return coins;
}

E<int64_t> Wallet::totalValueOf(const Address& owner)
{
    ASSIGN_OR_RETURN(auto coins, db.getCoinsByOwner(owner));
    int64_t total = 0;
    for(const Coin& c : coins)
    {
        if(c.value > std::numeric_limits<int64_t>::max() - total)
        {
            return std::unexpected(ledgerError(
                Errc::INVALID_AMOUNT,
                std::format("Coins of {} add up to more than {}", owner.str(),
                            std::numeric_limits<int64_t>::max())));
        }
        total += c.value;
    }
    return total;
}

E<Coin> Wallet::createCoin(const Address& owner, int64_t value)
{
    Coin c;
    ASSIGN_OR_RETURN(c.id, host.newObjectID());
    c.owner = owner;
    c.value = value;
    DO_OR_RETURN(db.createCoin(c));
    return c;
}

E<int64_t> Wallet::consumeCoin(const Address& caller, const ObjectID& coin)
{
    ASSIGN_OR_RETURN(Coin c, getCoin(coin));
    if(c.owner != caller)
    {
        return std::unexpected(ledgerError(
            Errc::NOT_OWNER, std::format("Coin {} is not yours", coin.str())));
    }
    DO_OR_RETURN(db.deleteCoin(c.id));
    return c.value;
}
