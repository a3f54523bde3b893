#include "suits.hpp"

#include <algorithm>
#include <format>
#include <limits>

#include <spdlog/spdlog.h>

#include "events.hpp"
#include "transaction.hpp"
#include "utils.hpp"

PostStore::PostStore(DatabaseInterface& db, HostInterface& host)
    : db(db), host(host)
{
}

E<Suit> PostStore::createSuit(const Address& caller,
                              const std::string& content,
                              const std::vector<std::string>& media_urls)
{
    auto length = utf8Length(content);
    if(!length.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_INPUT, "Content is not valid UTF-8"));
    }
    if(*length == 0)
    {
        return std::unexpected(ledgerError(Errc::EMPTY_CONTENT,
                                           "Content is empty"));
    }
    if(*length > MAX_SUIT_LENGTH)
    {
        return std::unexpected(ledgerError(
            Errc::CONTENT_TOO_LONG,
            std::format("Content is {} characters long, the limit is {}",
                        *length, MAX_SUIT_LENGTH)));
    }
    for(const std::string& url : media_urls)
    {
        if(!utf8Length(url).has_value())
        {
            return std::unexpected(ledgerError(
                Errc::INVALID_INPUT, "Media URL is not valid UTF-8"));
        }
    }

    Suit s;
    ASSIGN_OR_RETURN(s.id, host.newObjectID());
    s.creator = caller;
    s.content = content;
    s.media_urls = media_urls;
    s.created_at = host.nowMillis();

    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    DO_OR_RETURN(db.createSuit(s));
    DO_OR_RETURN(db.registerSuit(s.id, caller));
    DO_OR_RETURN(db.appendEvent(events::postCreated(s)));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("{} created suit {}", caller.str(), s.id.str());
    return s;
}

E<Suit> PostStore::getSuit(const ObjectID& id)
{
    ASSIGN_OR_RETURN(auto s, db.getSuitById(id));
    if(!s.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND, std::format("Suit {} not found", id.str())));
    }
    return *std::move(s);
}

E<std::vector<ObjectID>> PostStore::getRecent(uint64_t limit, uint64_t offset)
{
    ASSIGN_OR_RETURN(int64_t count, db.countSuits());
    uint64_t total = static_cast<uint64_t>(count);
    if(offset >= total || limit == 0)
    {
        return std::vector<ObjectID>();
    }
    // Position of the newest suit to return. Positions count from 0
    // at the oldest suit; offset < total, so this cannot wrap.
    uint64_t newest = total - 1 - offset;
    uint64_t n = std::min(limit, newest + 1);
    uint64_t oldest = newest + 1 - n;

    ASSIGN_OR_RETURN(auto ids, db.getSuitIndexRange(
                                   static_cast<int64_t>(oldest),
                                   static_cast<int64_t>(n)));
    std::reverse(ids.begin(), ids.end());
    return ids;
}

E<std::vector<ObjectID>> PostStore::getByCreator(const Address& creator)
{
    ASSIGN_OR_RETURN(auto ids, db.getSuitsByCreator(creator));
    return ids;
}

E<uint64_t> PostStore::totalSuits()
{
    ASSIGN_OR_RETURN(int64_t count, db.countSuits());
    return static_cast<uint64_t>(count);
}

E<Address> PostStore::creatorOf(const ObjectID& suit)
{
    ASSIGN_OR_RETURN(auto creator, db.getSuitCreator(suit));
    if(!creator.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND, std::format("Suit {} not found", suit.str())));
    }
    return *creator;
}

E<void> PostStore::updateCounters(const ObjectID& id,
                                  const std::function<void(Suit&)>& update)
{
    ASSIGN_OR_RETURN(Suit s, getSuit(id));
    update(s);
    DO_OR_RETURN(db.updateSuitCounters(s));
    return {};
}

E<void> PostStore::incrementLike(const ObjectID& suit)
{
    return updateCounters(suit, [](Suit& s) { s.like_count++; });
}

E<void> PostStore::decrementLike(const ObjectID& suit)
{
    return updateCounters(suit, [](Suit& s) {
        if(s.like_count > 0)
        {
            s.like_count--;
        }
    });
}

E<void> PostStore::incrementComment(const ObjectID& suit)
{
    return updateCounters(suit, [](Suit& s) { s.comment_count++; });
}

E<void> PostStore::incrementRetweet(const ObjectID& suit)
{
    return updateCounters(suit, [](Suit& s) { s.retweet_count++; });
}

E<void> PostStore::decrementRetweet(const ObjectID& suit)
{
    return updateCounters(suit, [](Suit& s) {
        if(s.retweet_count > 0)
        {
            s.retweet_count--;
        }
    });
}

E<void> PostStore::addTipAmount(const ObjectID& suit, int64_t amount)
{
    ASSIGN_OR_RETURN(Suit s, getSuit(suit));
    if(amount < 0 ||
       amount > std::numeric_limits<int64_t>::max() - s.tip_total)
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_AMOUNT,
            std::format("Cannot add {} to the tip total of suit {}", amount,
                        suit.str())));
    }
    s.tip_total += amount;
    DO_OR_RETURN(db.updateSuitCounters(s));
    return {};
}
