#include "event_log.hpp"

#include <format>
#include <limits>

E<std::vector<Event>> EventLog::since(int64_t after, int64_t limit)
{
    if(limit <= 0 || limit > std::numeric_limits<int>::max())
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_INPUT, std::format("Invalid limit {}", limit)));
    }
    ASSIGN_OR_RETURN(auto events, db.getEventsSince(after, static_cast<int>(limit)));
    return events;
}
