#include "transaction.hpp"

#include <spdlog/spdlog.h>

E<Transaction> Transaction::begin(DatabaseInterface& db)
{
    DO_OR_RETURN(db.beginTransaction());
    return Transaction(db);
}

Transaction::Transaction(Transaction&& rhs) noexcept
    : db(rhs.db), open(rhs.open)
{
    rhs.open = false;
}

Transaction::~Transaction()
{
    if(!open)
    {
        return;
    }
    spdlog::debug("Rolling back transaction");
    auto res = db->rollbackTransaction();
    if(!res)
    {
        spdlog::error("Failed to roll back transaction: {}",
                      mw::errorMsg(res.error()));
    }
}

E<void> Transaction::commit()
{
    DO_OR_RETURN(db->commitTransaction());
    open = false;
    return {};
}
