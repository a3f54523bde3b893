#include "ledger.hpp"

#include <spdlog/spdlog.h>

Ledger::Ledger(std::unique_ptr<DatabaseInterface> db_,
               std::unique_ptr<HostInterface> host_)
    : db(std::move(db_)), host(std::move(host_)),
      identity_registry(*db, *host),
      post_store(*db, *host),
      interaction_ledger(*db, *host, post_store),
      coin_wallet(*db, *host),
      tipping_ledger(*db, *host, post_store, coin_wallet),
      messaging_store(*db, *host),
      event_log(*db)
{
}

E<std::unique_ptr<Ledger>> Ledger::open(const std::string& db_path,
                                        const std::string& chain_id)
{
    auto db = std::make_unique<Database>(db_path);
    DO_OR_RETURN(db->init());
    spdlog::debug("Opened ledger database at {} for chain {}", db_path,
                  chain_id);
    return std::make_unique<Ledger>(std::move(db),
                                    std::make_unique<Host>(chain_id));
}
