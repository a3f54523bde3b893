#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mw/database.hpp>
#include <mw/error.hpp>

#include "events.hpp"
#include "types.hpp"

class DatabaseInterface
{
public:
    virtual ~DatabaseInterface() = default;
    virtual mw::E<void> init() = 0;

    // Transactions. Writers are serialized: beginTransaction() takes
    // the write lock, and fails at once if another writer holds it.
    virtual mw::E<void> beginTransaction() = 0;
    virtual mw::E<void> commitTransaction() = 0;
    virtual mw::E<void> rollbackTransaction() = 0;

    // Username registry DAO
    virtual mw::E<std::optional<Address>>
    getUsernameOwner(const std::string& username) = 0;
    virtual mw::E<void> addUsername(const std::string& username,
                                    const Address& owner) = 0;
    virtual mw::E<void> removeUsername(const std::string& username) = 0;

    // Profile DAO
    virtual mw::E<void> createProfile(const Profile& profile) = 0;
    virtual mw::E<void> updateProfile(const Profile& profile) = 0;
    virtual mw::E<std::optional<Profile>> getProfileById(const ObjectID& id) = 0;
    virtual mw::E<std::optional<Profile>>
    getProfileByOwner(const Address& owner) = 0;

    // Suit DAO
    virtual mw::E<void> createSuit(const Suit& suit) = 0;
    virtual mw::E<std::optional<Suit>> getSuitById(const ObjectID& id) = 0;
    virtual mw::E<void> updateSuitCounters(const Suit& suit) = 0;

    // Suit registry DAO. The registry keeps suits in creation order.
    virtual mw::E<void> registerSuit(const ObjectID& id,
                                     const Address& creator) = 0;
    virtual mw::E<std::optional<Address>> getSuitCreator(const ObjectID& id) = 0;
    virtual mw::E<int64_t> countSuits() = 0;
    // “Count” suits starting from position “begin” (0 is the oldest),
    // oldest first.
    virtual mw::E<std::vector<ObjectID>> getSuitIndexRange(int64_t begin,
                                                           int64_t count) = 0;
    virtual mw::E<std::vector<ObjectID>>
    getSuitsByCreator(const Address& creator) = 0;

    // Interaction registry DAO
    virtual mw::E<bool> hasInteraction(const std::string& key) = 0;
    virtual mw::E<void> addInteraction(const std::string& key) = 0;
    virtual mw::E<void> removeInteraction(const std::string& key) = 0;

    // Reaction DAO
    virtual mw::E<void> createReaction(const Reaction& reaction) = 0;
    virtual mw::E<std::optional<Reaction>> getReactionById(const ObjectID& id) = 0;
    virtual mw::E<void> deleteReaction(const ObjectID& id) = 0;

    // Comment DAO
    virtual mw::E<void> createComment(const Comment& comment) = 0;
    virtual mw::E<std::optional<Comment>> getCommentById(const ObjectID& id) = 0;

    // Coin DAO
    virtual mw::E<void> createCoin(const Coin& coin) = 0;
    virtual mw::E<void> updateCoin(const Coin& coin) = 0;
    virtual mw::E<void> deleteCoin(const ObjectID& id) = 0;
    virtual mw::E<std::optional<Coin>> getCoinById(const ObjectID& id) = 0;
    virtual mw::E<std::vector<Coin>> getCoinsByOwner(const Address& owner) = 0;

    // Tip balance DAO
    virtual mw::E<void> createTipBalance(const TipBalance& balance) = 0;
    virtual mw::E<void> updateTipBalance(const TipBalance& balance) = 0;
    virtual mw::E<std::optional<TipBalance>>
    getTipBalanceById(const ObjectID& id) = 0;

    // Tip balance registry DAO
    virtual mw::E<std::optional<ObjectID>>
    getBalanceIdByOwner(const Address& owner) = 0;
    virtual mw::E<void> registerBalance(const Address& owner,
                                        const ObjectID& id) = 0;

    // Chat DAO
    virtual mw::E<void> createChat(const Chat& chat) = 0;
    virtual mw::E<std::optional<Chat>> getChatById(const ObjectID& id) = 0;

    // Chat registry DAO
    virtual mw::E<std::optional<ObjectID>>
    getChatIdByKey(const std::string& key) = 0;
    virtual mw::E<void> registerChat(const std::string& key,
                                     const ObjectID& id) = 0;

    // Message DAO
    virtual mw::E<void> appendMessage(const ObjectID& chat_id, int64_t index,
                                      const Message& message) = 0;
    virtual mw::E<std::vector<Message>> getMessages(const ObjectID& chat_id) = 0;
    virtual mw::E<std::optional<Message>> getMessage(const ObjectID& chat_id,
                                                     int64_t index) = 0;
    virtual mw::E<int64_t> countMessages(const ObjectID& chat_id) = 0;
    virtual mw::E<void> markMessageRead(const ObjectID& chat_id,
                                        int64_t index) = 0;

    // Event outbox DAO
    virtual mw::E<int64_t> appendEvent(const Event& event) = 0;
    virtual mw::E<std::vector<Event>> getEventsSince(int64_t seq,
                                                     int limit) = 0;
};

class Database : public DatabaseInterface
{
public:
    explicit Database(const std::string& path);
    mw::E<void> init() override;

    mw::E<void> beginTransaction() override;
    mw::E<void> commitTransaction() override;
    mw::E<void> rollbackTransaction() override;

    // Username registry DAO
    mw::E<std::optional<Address>>
    getUsernameOwner(const std::string& username) override;
    mw::E<void> addUsername(const std::string& username,
                            const Address& owner) override;
    mw::E<void> removeUsername(const std::string& username) override;

    // Profile DAO
    mw::E<void> createProfile(const Profile& profile) override;
    mw::E<void> updateProfile(const Profile& profile) override;
    mw::E<std::optional<Profile>> getProfileById(const ObjectID& id) override;
    mw::E<std::optional<Profile>> getProfileByOwner(const Address& owner) override;

    // Suit DAO
    mw::E<void> createSuit(const Suit& suit) override;
    mw::E<std::optional<Suit>> getSuitById(const ObjectID& id) override;
    mw::E<void> updateSuitCounters(const Suit& suit) override;

    // Suit registry DAO
    mw::E<void> registerSuit(const ObjectID& id, const Address& creator) override;
    mw::E<std::optional<Address>> getSuitCreator(const ObjectID& id) override;
    mw::E<int64_t> countSuits() override;
    mw::E<std::vector<ObjectID>> getSuitIndexRange(int64_t begin,
                                                   int64_t count) override;
    mw::E<std::vector<ObjectID>> getSuitsByCreator(const Address& creator) override;

    // Interaction registry DAO
    mw::E<bool> hasInteraction(const std::string& key) override;
    mw::E<void> addInteraction(const std::string& key) override;
    mw::E<void> removeInteraction(const std::string& key) override;

    // Reaction DAO
    mw::E<void> createReaction(const Reaction& reaction) override;
    mw::E<std::optional<Reaction>> getReactionById(const ObjectID& id) override;
    mw::E<void> deleteReaction(const ObjectID& id) override;

    // Comment DAO
    mw::E<void> createComment(const Comment& comment) override;
    mw::E<std::optional<Comment>> getCommentById(const ObjectID& id) override;

    // Coin DAO
    mw::E<void> createCoin(const Coin& coin) override;
    mw::E<void> updateCoin(const Coin& coin) override;
    mw::E<void> deleteCoin(const ObjectID& id) override;
    mw::E<std::optional<Coin>> getCoinById(const ObjectID& id) override;
    mw::E<std::vector<Coin>> getCoinsByOwner(const Address& owner) override;

    // Tip balance DAO
    mw::E<void> createTipBalance(const TipBalance& balance) override;
    mw::E<void> updateTipBalance(const TipBalance& balance) override;
    mw::E<std::optional<TipBalance>> getTipBalanceById(const ObjectID& id) override;

    // Tip balance registry DAO
    mw::E<std::optional<ObjectID>> getBalanceIdByOwner(const Address& owner) override;
    mw::E<void> registerBalance(const Address& owner, const ObjectID& id) override;

    // Chat DAO
    mw::E<void> createChat(const Chat& chat) override;
    mw::E<std::optional<Chat>> getChatById(const ObjectID& id) override;

    // Chat registry DAO
    mw::E<std::optional<ObjectID>> getChatIdByKey(const std::string& key) override;
    mw::E<void> registerChat(const std::string& key, const ObjectID& id) override;

    // Message DAO
    mw::E<void> appendMessage(const ObjectID& chat_id, int64_t index,
                              const Message& message) override;
    mw::E<std::vector<Message>> getMessages(const ObjectID& chat_id) override;
    mw::E<std::optional<Message>> getMessage(const ObjectID& chat_id,
                                             int64_t index) override;
    mw::E<int64_t> countMessages(const ObjectID& chat_id) override;
    mw::E<void> markMessageRead(const ObjectID& chat_id, int64_t index) override;

    // Event outbox DAO
    mw::E<int64_t> appendEvent(const Event& event) override;
    mw::E<std::vector<Event>> getEventsSince(int64_t seq, int limit) override;

private:
    std::string db_path;
    std::unique_ptr<mw::SQLite> db;

    mw::E<void> migrate();
    mw::E<std::vector<std::string>> getSuitMedia(const ObjectID& id);
};
