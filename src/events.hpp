#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "error.hpp"
#include "types.hpp"

// A notification for the off-chain indexer. Events are written to
// the outbox in the same transaction as the change they describe.
struct Event
{
    enum Type
    {
        PROFILE_CREATED,
        PROFILE_UPDATED,
        POST_CREATED,
        LIKE_CREATED,
        LIKE_REMOVED,
        COMMENT_CREATED,
        RETWEET_CREATED,
        RETWEET_REMOVED,
        TIP_SENT,
        FUNDS_WITHDRAWN,
        CHAT_CREATED,
        MESSAGE_SENT,
        MESSAGE_READ,
    };

    // Assigned by the outbox.
    std::optional<int64_t> seq;
    Type type = PROFILE_CREATED;
    nlohmann::json data;
    int64_t created_at = 0;

    static std::string_view typeName(Type t);
    static E<Type> typeFromName(std::string_view name);
};

// Longest content preview carried by PostCreated, in code points.
constexpr size_t PREVIEW_LENGTH = 100;

namespace events
{
Event profileCreated(const Profile& p);
Event profileUpdated(const Profile& p, const std::string& old_username,
                     int64_t now);
Event postCreated(const Suit& s);
Event reactionCreated(const Reaction& r);
Event reactionRemoved(const Reaction& r, int64_t now);
Event commentCreated(const Comment& c);
Event tipSent(const ObjectID& suit, const Address& tipper,
              const Address& creator, int64_t amount, int64_t now);
Event fundsWithdrawn(const TipBalance& b, int64_t amount, int64_t now);
Event chatCreated(const Chat& c);
Event messageSent(const Chat& c, uint64_t index, const Message& m);
Event messageRead(const Chat& c, uint64_t index, const Address& reader,
                  const Address& sender, int64_t now);
} // namespace events
