#pragma once

#include <string>

#include "database.hpp"
#include "error.hpp"
#include "host.hpp"
#include "suits.hpp"
#include "types.hpp"

// Likes, retweets and comments. A (suit, user) pair is either liked
// or not, and either retweeted or not; the interaction registry holds
// one key per present pair.
class InteractionLedger
{
public:
    InteractionLedger(DatabaseInterface& db, HostInterface& host,
                      SuitCountersInterface& suits);

    E<Reaction> likeSuit(const Address& caller, const ObjectID& suit);
    // “Like” must be the caller’s like of “suit”.
    E<void> unlikeSuit(const Address& caller, const ObjectID& suit,
                       const ObjectID& like);
    E<Reaction> retweetSuit(const Address& caller, const ObjectID& suit);
    E<void> unretweetSuit(const Address& caller, const ObjectID& suit,
                          const ObjectID& retweet);
    // Comments are not deduplicated, and may be left on one’s own
    // suit.
    E<Comment> commentOnSuit(const Address& caller, const ObjectID& suit,
                             const std::string& content);

    E<bool> hasLiked(const ObjectID& suit, const Address& user);
    E<bool> hasRetweeted(const ObjectID& suit, const Address& user);

    E<Reaction> getLike(const ObjectID& id);
    E<Reaction> getRetweet(const ObjectID& id);
    E<Comment> getComment(const ObjectID& id);

private:
    E<Reaction> react(Reaction::Kind kind, const Address& caller,
                      const ObjectID& suit);
    E<void> undo(Reaction::Kind kind, const Address& caller,
                 const ObjectID& suit, const ObjectID& reaction_id);
    E<Reaction> getReaction(Reaction::Kind kind, const ObjectID& id);

    DatabaseInterface& db;
    HostInterface& host;
    SuitCountersInterface& suits;
};
