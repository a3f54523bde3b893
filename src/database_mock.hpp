#pragma once

#include <gmock/gmock.h>

#include "database.hpp"

class DatabaseMock : public DatabaseInterface
{
public:
    MOCK_METHOD(mw::E<void>, init, (), (override));
    MOCK_METHOD(mw::E<void>, beginTransaction, (), (override));
    MOCK_METHOD(mw::E<void>, commitTransaction, (), (override));
    MOCK_METHOD(mw::E<void>, rollbackTransaction, (), (override));
    MOCK_METHOD(mw::E<std::optional<Address>>, getUsernameOwner, (const std::string&), (override));
    MOCK_METHOD(mw::E<void>, addUsername, (const std::string&, const Address&), (override));
    MOCK_METHOD(mw::E<void>, removeUsername, (const std::string&), (override));
    MOCK_METHOD(mw::E<void>, createProfile, (const Profile&), (override));
    MOCK_METHOD(mw::E<void>, updateProfile, (const Profile&), (override));
    MOCK_METHOD(mw::E<std::optional<Profile>>, getProfileById, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<std::optional<Profile>>, getProfileByOwner, (const Address&), (override));
    MOCK_METHOD(mw::E<void>, createSuit, (const Suit&), (override));
    MOCK_METHOD(mw::E<std::optional<Suit>>, getSuitById, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<void>, updateSuitCounters, (const Suit&), (override));
    MOCK_METHOD(mw::E<void>, registerSuit, (const ObjectID&, const Address&), (override));
    MOCK_METHOD(mw::E<std::optional<Address>>, getSuitCreator, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<int64_t>, countSuits, (), (override));
    MOCK_METHOD(mw::E<std::vector<ObjectID>>, getSuitIndexRange, (int64_t, int64_t), (override));
    MOCK_METHOD(mw::E<std::vector<ObjectID>>, getSuitsByCreator, (const Address&), (override));
    MOCK_METHOD(mw::E<bool>, hasInteraction, (const std::string&), (override));
    MOCK_METHOD(mw::E<void>, addInteraction, (const std::string&), (override));
    MOCK_METHOD(mw::E<void>, removeInteraction, (const std::string&), (override));
    MOCK_METHOD(mw::E<void>, createReaction, (const Reaction&), (override));
    MOCK_METHOD(mw::E<std::optional<Reaction>>, getReactionById, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<void>, deleteReaction, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<void>, createComment, (const Comment&), (override));
    MOCK_METHOD(mw::E<std::optional<Comment>>, getCommentById, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<void>, createCoin, (const Coin&), (override));
    MOCK_METHOD(mw::E<void>, updateCoin, (const Coin&), (override));
    MOCK_METHOD(mw::E<void>, deleteCoin, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<std::optional<Coin>>, getCoinById, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<std::vector<Coin>>, getCoinsByOwner, (const Address&), (override));
    MOCK_METHOD(mw::E<void>, createTipBalance, (const TipBalance&), (override));
    MOCK_METHOD(mw::E<void>, updateTipBalance, (const TipBalance&), (override));
    MOCK_METHOD(mw::E<std::optional<TipBalance>>, getTipBalanceById, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<std::optional<ObjectID>>, getBalanceIdByOwner, (const Address&), (override));
    MOCK_METHOD(mw::E<void>, registerBalance, (const Address&, const ObjectID&), (override));
    MOCK_METHOD(mw::E<void>, createChat, (const Chat&), (override));
    MOCK_METHOD(mw::E<std::optional<Chat>>, getChatById, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<std::optional<ObjectID>>, getChatIdByKey, (const std::string&), (override));
    MOCK_METHOD(mw::E<void>, registerChat, (const std::string&, const ObjectID&), (override));
    MOCK_METHOD(mw::E<void>, appendMessage, (const ObjectID&, int64_t, const Message&), (override));
    MOCK_METHOD(mw::E<std::vector<Message>>, getMessages, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<std::optional<Message>>, getMessage, (const ObjectID&, int64_t), (override));
    MOCK_METHOD(mw::E<int64_t>, countMessages, (const ObjectID&), (override));
    MOCK_METHOD(mw::E<void>, markMessageRead, (const ObjectID&, int64_t), (override));
    MOCK_METHOD(mw::E<int64_t>, appendEvent, (const Event&), (override));
    MOCK_METHOD(mw::E<std::vector<Event>>, getEventsSince, (int64_t, int), (override));
};
