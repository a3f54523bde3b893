#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "database.hpp"
#include "error.hpp"
#include "host.hpp"
#include "types.hpp"

// In code points.
constexpr size_t MAX_SUIT_LENGTH = 280;

// The part of the post store other ledgers are allowed to touch:
// creator lookup and the denormalized counters. The counter
// operations do not open a transaction of their own; they are meant
// to run inside the caller’s.
class SuitCountersInterface
{
public:
    virtual ~SuitCountersInterface() = default;

    virtual E<Address> creatorOf(const ObjectID& suit) = 0;
    virtual E<void> incrementLike(const ObjectID& suit) = 0;
    // Floors at zero.
    virtual E<void> decrementLike(const ObjectID& suit) = 0;
    virtual E<void> incrementComment(const ObjectID& suit) = 0;
    virtual E<void> incrementRetweet(const ObjectID& suit) = 0;
    // Floors at zero.
    virtual E<void> decrementRetweet(const ObjectID& suit) = 0;
    virtual E<void> addTipAmount(const ObjectID& suit, int64_t amount) = 0;
};

class PostStore : public SuitCountersInterface
{
public:
    PostStore(DatabaseInterface& db, HostInterface& host);

    E<Suit> createSuit(const Address& caller, const std::string& content,
                       const std::vector<std::string>& media_urls);
    E<Suit> getSuit(const ObjectID& id);
    // Up to “limit” suit IDs, newest first, after skipping the
    // “offset” newest ones.
    E<std::vector<ObjectID>> getRecent(uint64_t limit, uint64_t offset);
    // All suits of “creator”, oldest first. Linear in the total
    // number of suits.
    E<std::vector<ObjectID>> getByCreator(const Address& creator);
    E<uint64_t> totalSuits();

    E<Address> creatorOf(const ObjectID& suit) override;
    E<void> incrementLike(const ObjectID& suit) override;
    E<void> decrementLike(const ObjectID& suit) override;
    E<void> incrementComment(const ObjectID& suit) override;
    E<void> incrementRetweet(const ObjectID& suit) override;
    E<void> decrementRetweet(const ObjectID& suit) override;
    E<void> addTipAmount(const ObjectID& suit, int64_t amount) override;

private:
    E<void> updateCounters(const ObjectID& id,
                           const std::function<void(Suit&)>& update);

    DatabaseInterface& db;
    HostInterface& host;
};
