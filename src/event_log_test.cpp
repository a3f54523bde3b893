#include <limits>

#include <gtest/gtest.h>

#include "event_log.hpp"
#include "ledger_fixture.hpp"
#include "test_utils.hpp"

using EventLogTest = LedgerTest;

TEST_F(EventLogTest, EventsAreSequenced)
{
    ASSERT_TRUE(ledger->identity().createProfile(alice, "alice", "", ""));
    ASSIGN_OR_FAIL(Suit s, ledger->posts().createSuit(alice, "hi", {}));
    ASSERT_TRUE(ledger->interactions().likeSuit(bob, s.id));

    ASSIGN_OR_FAIL(auto events, ledger->events().since(0, 10));
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].type, Event::PROFILE_CREATED);
    EXPECT_EQ(events[1].type, Event::POST_CREATED);
    EXPECT_EQ(events[2].type, Event::LIKE_CREATED);
    EXPECT_LT(*events[0].seq, *events[1].seq);
    EXPECT_LT(*events[1].seq, *events[2].seq);

    ASSIGN_OR_FAIL(auto tail, ledger->events().since(*events[0].seq, 10));
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0].seq, events[1].seq);

    ASSIGN_OR_FAIL(auto limited, ledger->events().since(0, 1));
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].type, Event::PROFILE_CREATED);

    ASSIGN_OR_FAIL(auto none, ledger->events().since(*events[2].seq, 10));
    EXPECT_TRUE(none.empty());
}

TEST_F(EventLogTest, FailedOperationsEmitNothing)
{
    ASSIGN_OR_FAIL(Suit s, ledger->posts().createSuit(alice, "hi", {}));
    EXPECT_FALSE(ledger->interactions().likeSuit(alice, s.id));
    EXPECT_FALSE(ledger->posts().createSuit(alice, "", {}));
    EXPECT_EQ(allEvents().size(), 1u);
}

TEST_F(EventLogTest, RejectsBadLimit)
{
    EXPECT_ERRC(ledger->events().since(0, 0), Errc::INVALID_INPUT);
    EXPECT_ERRC(ledger->events().since(0, -1), Errc::INVALID_INPUT);
    // Must not wrap around to a limit of 1.
    EXPECT_ERRC(ledger->events().since(0, 4294967297), Errc::INVALID_INPUT);
    ASSIGN_OR_FAIL(auto events, ledger->events().since(
        0, std::numeric_limits<int>::max()));
    EXPECT_TRUE(events.empty());
}

TEST(EventType, NamesRoundTrip)
{
    EXPECT_EQ(Event::typeName(Event::TIP_SENT), "TipSent");
    ASSIGN_OR_FAIL(Event::Type t, Event::typeFromName("MessageRead"));
    EXPECT_EQ(t, Event::MESSAGE_READ);
    EXPECT_ERRC(Event::typeFromName("Nope"), Errc::INVALID_INPUT);
}
