#pragma once

#include <memory>
#include <string>

#include "database.hpp"
#include "error.hpp"
#include "event_log.hpp"
#include "host.hpp"
#include "interactions.hpp"
#include "messaging.hpp"
#include "profile.hpp"
#include "suits.hpp"
#include "tipping.hpp"
#include "wallet.hpp"

// All the stores of one chain, sharing a database and a host.
class Ledger
{
public:
    // The database should already be initialized.
    Ledger(std::unique_ptr<DatabaseInterface> db,
           std::unique_ptr<HostInterface> host);

    static E<std::unique_ptr<Ledger>> open(const std::string& db_path,
                                           const std::string& chain_id);

    IdentityRegistry& identity() { return identity_registry; }
    PostStore& posts() { return post_store; }
    InteractionLedger& interactions() { return interaction_ledger; }
    Wallet& wallet() { return coin_wallet; }
    TippingLedger& tipping() { return tipping_ledger; }
    MessagingStore& messaging() { return messaging_store; }
    EventLog& events() { return event_log; }

private:
    std::unique_ptr<DatabaseInterface> db;
    std::unique_ptr<HostInterface> host;
    IdentityRegistry identity_registry;
    PostStore post_store;
    InteractionLedger interaction_ledger;
    Wallet coin_wallet;
    TippingLedger tipping_ledger;
    MessagingStore messaging_store;
    EventLog event_log;
};
