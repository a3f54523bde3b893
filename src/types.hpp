#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "utils.hpp"

constexpr size_t ID_LENGTH = 32;

// An account on the chain. Written as “0x” followed by 64 lower case
// hex digits. Addresses are ordered by their bytes.
struct Address
{
    std::array<unsigned char, ID_LENGTH> bytes{};

    // Accepts an optional “0x” prefix and either case. Short forms
    // are left-padded with zeros, so “0x6” is a valid address.
    static E<Address> fromStr(std::string_view s);
    std::string str() const;

    auto operator<=>(const Address&) const = default;
};

// Identity of an object, allocated by the host.
struct ObjectID
{
    std::array<unsigned char, ID_LENGTH> bytes{};

    static E<ObjectID> fromStr(std::string_view s);
    static ObjectID fromBytes(std::span<const unsigned char, ID_LENGTH> b);
    std::string str() const;

    auto operator<=>(const ObjectID&) const = default;
};

struct Profile
{
    ObjectID id;
    Address owner;
    std::string username;
    std::string bio;
    std::string pfp_url;
    int64_t created_at = 0;
    // Nothing maintains these yet.
    int64_t followers_count = 0;
    int64_t following_count = 0;
};

// A post.
struct Suit
{
    ObjectID id;
    Address creator;
    std::string content;
    std::vector<std::string> media_urls;
    int64_t created_at = 0;
    int64_t like_count = 0;
    int64_t comment_count = 0;
    int64_t retweet_count = 0;
    // In minor units.
    int64_t tip_total = 0;
};

// A like or a retweet. At most one of each kind exists per (suit,
// actor) pair.
struct Reaction
{
    enum Kind { LIKE = 1, RETWEET = 2 };

    ObjectID id;
    Kind kind = LIKE;
    ObjectID suit_id;
    Address actor;
    int64_t created_at = 0;
};

struct Comment
{
    ObjectID id;
    ObjectID suit_id;
    Address commenter;
    std::string content;
    int64_t created_at = 0;
};

// A piece of the native currency, owned by one address.
struct Coin
{
    ObjectID id;
    Address owner;
    int64_t value = 0;
};

// Invariant: balance == total_received - total_withdrawn.
struct TipBalance
{
    ObjectID id;
    Address owner;
    int64_t balance = 0;
    int64_t total_received = 0;
    int64_t total_withdrawn = 0;
};

// Participants are stored in canonical order, participant_1 <
// participant_2.
struct Chat
{
    ObjectID id;
    Address participant_1;
    Address participant_2;
    int64_t created_at = 0;

    bool hasParticipant(const Address& a) const
    {
        return a == participant_1 || a == participant_2;
    }

    const Address& otherParticipant(const Address& a) const
    {
        return a == participant_1 ? participant_2 : participant_1;
    }
};

// Content and hash are produced by the client and never interpreted
// here.
struct Message
{
    Address sender;
    Bytes encrypted_content;
    Bytes content_hash;
    int64_t timestamp = 0;
    bool is_read = false;
};

// Registry key of a (suit, actor) reaction: kind tag, suit bytes,
// actor bytes, hex encoded.
std::string interactionKey(Reaction::Kind kind, const ObjectID& suit,
                           const Address& actor);

// Registry key of the chat between “a” and “b”. Symmetric in its
// arguments.
std::string chatKey(const Address& a, const Address& b);
