#pragma once

#include <cstdint>
#include <vector>

#include "database.hpp"
#include "error.hpp"
#include "events.hpp"

// Read side of the event outbox, for indexers.
class EventLog
{
public:
    explicit EventLog(DatabaseInterface& db) : db(db) {}

    // Up to “limit” events with a sequence number greater than
    // “after”, in the order they were emitted. “limit” must be in
    // [1, INT_MAX].
    E<std::vector<Event>> since(int64_t after, int64_t limit);

private:
    DatabaseInterface& db;
};
