#include "interactions.hpp"

#include <format>
#include <string_view>

#include <spdlog/spdlog.h>

#include "events.hpp"
#include "transaction.hpp"
#include "utils.hpp"

namespace {

std::string_view kindName(Reaction::Kind kind)
{
    return kind == Reaction::LIKE ? "like" : "retweet";
}

} // namespace

InteractionLedger::InteractionLedger(DatabaseInterface& db,
                                     HostInterface& host,
                                     SuitCountersInterface& suits)
    : db(db), host(host), suits(suits)
{
}

E<Reaction> InteractionLedger::react(Reaction::Kind kind,
                                     const Address& caller,
                                     const ObjectID& suit)
{
    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(Address creator, suits.creatorOf(suit));
    if(creator == caller)
    {
        return std::unexpected(ledgerError(
            Errc::CANNOT_ACT_ON_OWN_POST,
            std::format("Cannot {} your own suit", kindName(kind))));
    }

    std::string key = interactionKey(kind, suit, caller);
    ASSIGN_OR_RETURN(bool present, db.hasInteraction(key));
    if(present)
    {
        if(kind == Reaction::LIKE)
        {
            return std::unexpected(ledgerError(
                Errc::ALREADY_LIKED, "Suit is already liked"));
        }
        return std::unexpected(ledgerError(
            Errc::ALREADY_RETWEETED, "Suit is already retweeted"));
    }

    Reaction r;
    ASSIGN_OR_RETURN(r.id, host.newObjectID());
    r.kind = kind;
    r.suit_id = suit;
    r.actor = caller;
    r.created_at = host.nowMillis();

    DO_OR_RETURN(db.addInteraction(key));
    if(kind == Reaction::LIKE)
    {
        DO_OR_RETURN(suits.incrementLike(suit));
    }
    else
    {
        DO_OR_RETURN(suits.incrementRetweet(suit));
    }
    DO_OR_RETURN(db.createReaction(r));
    DO_OR_RETURN(db.appendEvent(events::reactionCreated(r)));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("Created {} {} of suit {} by {}", kindName(kind), r.id.str(),
                  suit.str(), caller.str());
    return r;
}

E<void> InteractionLedger::undo(Reaction::Kind kind, const Address& caller,
                                const ObjectID& suit,
                                const ObjectID& reaction_id)
{
    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(Reaction r, getReaction(kind, reaction_id));
    if(r.actor != caller)
    {
        return std::unexpected(ledgerError(
            Errc::NOT_OWNER,
            std::format("The {} belongs to someone else", kindName(kind))));
    }
    if(r.suit_id != suit)
    {
        return std::unexpected(ledgerError(
            Errc::MISMATCHED_POST,
            std::format("The {} is for suit {}", kindName(kind),
                        r.suit_id.str())));
    }

    DO_OR_RETURN(db.removeInteraction(interactionKey(kind, suit, caller)));
    if(kind == Reaction::LIKE)
    {
        DO_OR_RETURN(suits.decrementLike(suit));
    }
    else
    {
        DO_OR_RETURN(suits.decrementRetweet(suit));
    }
    DO_OR_RETURN(db.deleteReaction(r.id));
    DO_OR_RETURN(db.appendEvent(events::reactionRemoved(r, host.nowMillis())));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("{} removed {} of suit {}", caller.str(), kindName(kind),
                  suit.str());
    return {};
}

E<Reaction> InteractionLedger::likeSuit(const Address& caller,
                                        const ObjectID& suit)
{
    return react(Reaction::LIKE, caller, suit);
}

E<void> InteractionLedger::unlikeSuit(const Address& caller,
                                      const ObjectID& suit,
                                      const ObjectID& like)
{
    return undo(Reaction::LIKE, caller, suit, like);
}

E<Reaction> InteractionLedger::retweetSuit(const Address& caller,
                                           const ObjectID& suit)
{
    return react(Reaction::RETWEET, caller, suit);
}

E<void> InteractionLedger::unretweetSuit(const Address& caller,
                                         const ObjectID& suit,
                                         const ObjectID& retweet)
{
    return undo(Reaction::RETWEET, caller, suit, retweet);
}

E<Comment> InteractionLedger::commentOnSuit(const Address& caller,
                                            const ObjectID& suit,
                                            const std::string& content)
{
    auto length = utf8Length(content);
    if(!length.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_INPUT, "Comment is not valid UTF-8"));
    }
    if(*length == 0)
    {
        return std::unexpected(ledgerError(Errc::EMPTY_COMMENT,
                                           "Comment is empty"));
    }

    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    // Fails if the suit does not exist.
    DO_OR_RETURN(suits.creatorOf(suit));

    Comment c;
    ASSIGN_OR_RETURN(c.id, host.newObjectID());
    c.suit_id = suit;
    c.commenter = caller;
    c.content = content;
    c.created_at = host.nowMillis();

    DO_OR_RETURN(suits.incrementComment(suit));
    DO_OR_RETURN(db.createComment(c));
    DO_OR_RETURN(db.appendEvent(events::commentCreated(c)));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("{} commented on suit {}", caller.str(), suit.str());
    return c;
}

E<bool> InteractionLedger::hasLiked(const ObjectID& suit, const Address& user)
{
    ASSIGN_OR_RETURN(bool present, db.hasInteraction(
                                       interactionKey(Reaction::LIKE, suit, user)));
    return present;
}

E<bool> InteractionLedger::hasRetweeted(const ObjectID& suit,
                                        const Address& user)
{
    ASSIGN_OR_RETURN(bool present, db.hasInteraction(
                                       interactionKey(Reaction::RETWEET, suit,
                                                      user)));
    return present;
}

E<Reaction> InteractionLedger::getReaction(Reaction::Kind kind,
                                           const ObjectID& id)
{
    ASSIGN_OR_RETURN(auto r, db.getReactionById(id));
    if(!r.has_value() || r->kind != kind)
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND,
            std::format("No {} with ID {}", kindName(kind), id.str())));
    }
    return *r;
}

E<Reaction> InteractionLedger::getLike(const ObjectID& id)
{
    return getReaction(Reaction::LIKE, id);
}

E<Reaction> InteractionLedger::getRetweet(const ObjectID& id)
{
    return getReaction(Reaction::RETWEET, id);
}

E<Comment> InteractionLedger::getComment(const ObjectID& id)
{
    ASSIGN_OR_RETURN(auto c, db.getCommentById(id));
    if(!c.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND, std::format("Comment {} not found", id.str())));
    }
    return *std::move(c);
}
