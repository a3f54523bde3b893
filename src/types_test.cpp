#include <gtest/gtest.h>

#include "error.hpp"
#include "test_utils.hpp"
#include "types.hpp"

TEST(Address, CanParse)
{
    ASSIGN_OR_FAIL(Address a, Address::fromStr(
        "0x00000000000000000000000000000000000000000000000000000000000000ab"));
    EXPECT_EQ(a.bytes[31], 0xab);
    EXPECT_EQ(a.bytes[0], 0);

    ASSIGN_OR_FAIL(Address short_form, Address::fromStr("0xAB"));
    EXPECT_EQ(short_form, a);
    ASSIGN_OR_FAIL(Address no_prefix, Address::fromStr("ab"));
    EXPECT_EQ(no_prefix, a);
}

TEST(Address, StringFormIsCanonical)
{
    ASSIGN_OR_FAIL(Address a, Address::fromStr("0x6"));
    EXPECT_EQ(a.str(),
              "0x0000000000000000000000000000000000000000000000000000000000000006");
    ASSIGN_OR_FAIL(Address back, Address::fromStr(a.str()));
    EXPECT_EQ(back, a);
}

TEST(Address, FailOnInvalidAddress)
{
    EXPECT_ERRC(Address::fromStr(""), Errc::INVALID_INPUT);
    EXPECT_ERRC(Address::fromStr("0x"), Errc::INVALID_INPUT);
    EXPECT_ERRC(Address::fromStr("0xg1"), Errc::INVALID_INPUT);
    EXPECT_ERRC(Address::fromStr("0x" + std::string(65, '1')),
                Errc::INVALID_INPUT);
}

TEST(Address, OrderedByBytes)
{
    ASSIGN_OR_FAIL(Address a, Address::fromStr("0x01"));
    ASSIGN_OR_FAIL(Address b, Address::fromStr("0x0100"));
    ASSIGN_OR_FAIL(Address c, Address::fromStr("0x" + std::string(64, 'f')));
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
}

TEST(ObjectID, CanParse)
{
    ASSIGN_OR_FAIL(ObjectID id, ObjectID::fromStr("0x2a"));
    EXPECT_EQ(id.bytes[31], 42);
    EXPECT_ERRC(ObjectID::fromStr("nope"), Errc::INVALID_INPUT);
}

TEST(InteractionKey, DistinguishesKindSuitAndActor)
{
    ASSIGN_OR_FAIL(ObjectID suit, ObjectID::fromStr("0x1"));
    ASSIGN_OR_FAIL(ObjectID other_suit, ObjectID::fromStr("0x2"));
    ASSIGN_OR_FAIL(Address alice, Address::fromStr("0xa"));
    ASSIGN_OR_FAIL(Address bob, Address::fromStr("0xb"));

    std::string key = interactionKey(Reaction::LIKE, suit, alice);
    EXPECT_EQ(key.size(), 2 + ID_LENGTH * 4);
    EXPECT_TRUE(key.starts_with("01"));
    EXPECT_TRUE(interactionKey(Reaction::RETWEET, suit, alice)
                .starts_with("02"));
    EXPECT_NE(key, interactionKey(Reaction::RETWEET, suit, alice));
    EXPECT_NE(key, interactionKey(Reaction::LIKE, other_suit, alice));
    EXPECT_NE(key, interactionKey(Reaction::LIKE, suit, bob));
    EXPECT_EQ(key, interactionKey(Reaction::LIKE, suit, alice));
}

TEST(ChatKey, IsSymmetric)
{
    ASSIGN_OR_FAIL(Address alice, Address::fromStr("0xa"));
    ASSIGN_OR_FAIL(Address bob, Address::fromStr("0xb"));
    ASSIGN_OR_FAIL(Address carol, Address::fromStr("0xc"));
    EXPECT_EQ(chatKey(alice, bob), chatKey(bob, alice));
    EXPECT_TRUE(chatKey(bob, alice).starts_with(hexEncode(alice.bytes)));
    EXPECT_NE(chatKey(alice, bob), chatKey(alice, carol));
}

TEST(Chat, KnowsItsParticipants)
{
    Chat c;
    ASSIGN_OR_FAIL(c.participant_1, Address::fromStr("0xa"));
    ASSIGN_OR_FAIL(c.participant_2, Address::fromStr("0xb"));
    ASSIGN_OR_FAIL(Address carol, Address::fromStr("0xc"));
    EXPECT_TRUE(c.hasParticipant(c.participant_1));
    EXPECT_TRUE(c.hasParticipant(c.participant_2));
    EXPECT_FALSE(c.hasParticipant(carol));
    EXPECT_EQ(c.otherParticipant(c.participant_1), c.participant_2);
    EXPECT_EQ(c.otherParticipant(c.participant_2), c.participant_1);
}
