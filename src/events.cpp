#include "events.hpp"

#include <format>

#include "utils.hpp"

namespace {

constexpr std::string_view TYPE_NAMES[] = {
    "ProfileCreated", "ProfileUpdated", "PostCreated", "LikeCreated",
    "LikeRemoved", "CommentCreated", "RetweetCreated", "RetweetRemoved",
    "TipSent", "FundsWithdrawn", "ChatCreated", "MessageSent", "MessageRead",
};

Event makeEvent(Event::Type type, nlohmann::json data, int64_t now)
{
    Event e;
    e.type = type;
    e.data = std::move(data);
    e.created_at = now;
    return e;
}

} // namespace

std::string_view Event::typeName(Type t)
{
    return TYPE_NAMES[t];
}

E<Event::Type> Event::typeFromName(std::string_view name)
{
    for(size_t i = 0; i < std::size(TYPE_NAMES); i++)
    {
        if(TYPE_NAMES[i] == name)
        {
            return static_cast<Type>(i);
        }
    }
    return std::unexpected(ledgerError(
        Errc::INVALID_INPUT, std::format("Unknown event type: {}", name)));
}

namespace events
{

Event profileCreated(const Profile& p)
{
    return makeEvent(Event::PROFILE_CREATED,
                     {{"profile_id", p.id.str()},
                      {"owner", p.owner.str()},
                      {"username", p.username}},
                     p.created_at);
}

Event profileUpdated(const Profile& p, const std::string& old_username,
                     int64_t now)
{
    return makeEvent(Event::PROFILE_UPDATED,
                     {{"profile_id", p.id.str()},
                      {"owner", p.owner.str()},
                      {"old_username", old_username},
                      {"username", p.username}},
                     now);
}

Event postCreated(const Suit& s)
{
    return makeEvent(Event::POST_CREATED,
                     {{"suit_id", s.id.str()},
                      {"creator", s.creator.str()},
                      {"content_preview", utf8Prefix(s.content, PREVIEW_LENGTH)},
                      {"timestamp", s.created_at}},
                     s.created_at);
}

Event reactionCreated(const Reaction& r)
{
    if(r.kind == Reaction::LIKE)
    {
        return makeEvent(Event::LIKE_CREATED,
                         {{"like_id", r.id.str()},
                          {"suit_id", r.suit_id.str()},
                          {"liker", r.actor.str()}},
                         r.created_at);
    }
    return makeEvent(Event::RETWEET_CREATED,
                     {{"retweet_id", r.id.str()},
                      {"suit_id", r.suit_id.str()},
                      {"retweeter", r.actor.str()}},
                     r.created_at);
}

Event reactionRemoved(const Reaction& r, int64_t now)
{
    if(r.kind == Reaction::LIKE)
    {
        return makeEvent(Event::LIKE_REMOVED,
                         {{"like_id", r.id.str()},
                          {"suit_id", r.suit_id.str()},
                          {"liker", r.actor.str()}},
                         now);
    }
    return makeEvent(Event::RETWEET_REMOVED,
                     {{"retweet_id", r.id.str()},
                      {"suit_id", r.suit_id.str()},
                      {"retweeter", r.actor.str()}},
                     now);
}

Event commentCreated(const Comment& c)
{
    return makeEvent(Event::COMMENT_CREATED,
                     {{"comment_id", c.id.str()},
                      {"suit_id", c.suit_id.str()},
                      {"commenter", c.commenter.str()}},
                     c.created_at);
}

Event tipSent(const ObjectID& suit, const Address& tipper,
              const Address& creator, int64_t amount, int64_t now)
{
    return makeEvent(Event::TIP_SENT,
                     {{"suit_id", suit.str()},
                      {"tipper", tipper.str()},
                      {"creator", creator.str()},
                      {"amount", amount}},
                     now);
}

Event fundsWithdrawn(const TipBalance& b, int64_t amount, int64_t now)
{
    return makeEvent(Event::FUNDS_WITHDRAWN,
                     {{"balance_id", b.id.str()},
                      {"owner", b.owner.str()},
                      {"amount", amount}},
                     now);
}

Event chatCreated(const Chat& c)
{
    return makeEvent(Event::CHAT_CREATED,
                     {{"chat_id", c.id.str()},
                      {"participant_1", c.participant_1.str()},
                      {"participant_2", c.participant_2.str()}},
                     c.created_at);
}

Event messageSent(const Chat& c, uint64_t index, const Message& m)
{
    return makeEvent(Event::MESSAGE_SENT,
                     {{"chat_id", c.id.str()},
                      {"sender", m.sender.str()},
                      {"recipient", c.otherParticipant(m.sender).str()},
                      {"message_index", index},
                      {"timestamp", m.timestamp}},
                     m.timestamp);
}

Event messageRead(const Chat& c, uint64_t index, const Address& reader,
                  const Address& sender, int64_t now)
{
    return makeEvent(Event::MESSAGE_READ,
                     {{"chat_id", c.id.str()},
                      {"message_index", index},
                      {"reader", reader.str()},
                      {"sender", sender.str()}},
                     now);
}

} // namespace events
