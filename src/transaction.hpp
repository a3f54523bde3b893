#pragma once

#include "database.hpp"
#include "error.hpp"

// Holds an open database transaction. Unless commit() succeeds, the
// transaction is rolled back when the guard goes away, so an
// operation that returns early on an error leaves nothing behind.
class Transaction
{
public:
    static E<Transaction> begin(DatabaseInterface& db);

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& rhs) noexcept;
    Transaction& operator=(Transaction&&) = delete;
    ~Transaction();

    E<void> commit();

private:
    explicit Transaction(DatabaseInterface& db) : db(&db) {}

    DatabaseInterface* db;
    bool open = true;
};
