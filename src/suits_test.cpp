#include <limits>

#include <gtest/gtest.h>

#include "ledger_fixture.hpp"
#include "suits.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

class SuitsTest : public LedgerTest
{
protected:
    // Create “n” suits by alice, one millisecond apart. Returns their
    // IDs oldest first.
    std::vector<ObjectID> createSuits(int n)
    {
        std::vector<ObjectID> ids;
        for(int i = 0; i < n; i++)
        {
            now++;
            auto s = ledger->posts().createSuit(
                alice, std::format("suit {}", i), {});
            EXPECT_TRUE(s.has_value());
            if(s.has_value())
            {
                ids.push_back(s->id);
            }
        }
        return ids;
    }
};

TEST_F(SuitsTest, CanCreateSuit)
{
    now = 5000;
    ASSIGN_OR_FAIL(Suit s, ledger->posts().createSuit(
        alice, "Hello world", {"https://a.png", "https://b.png"}));
    EXPECT_EQ(s.creator, alice);
    EXPECT_EQ(s.created_at, 5000);
    EXPECT_EQ(s.like_count, 0);
    EXPECT_EQ(s.comment_count, 0);
    EXPECT_EQ(s.retweet_count, 0);
    EXPECT_EQ(s.tip_total, 0);

    ASSIGN_OR_FAIL(Suit stored, ledger->posts().getSuit(s.id));
    EXPECT_EQ(stored.content, "Hello world");
    EXPECT_EQ(stored.media_urls,
              (std::vector<std::string>{"https://a.png", "https://b.png"}));
    ASSIGN_OR_FAIL(Address creator, ledger->posts().creatorOf(s.id));
    EXPECT_EQ(creator, alice);
    ASSIGN_OR_FAIL(uint64_t total, ledger->posts().totalSuits());
    EXPECT_EQ(total, 1u);

    auto created = eventsOfType(Event::POST_CREATED);
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0].data["suit_id"], s.id.str());
    EXPECT_EQ(created[0].data["content_preview"], "Hello world");
    EXPECT_EQ(created[0].data["timestamp"], 5000);
}

TEST_F(SuitsTest, ContentLengthIsCheckedInCodePoints)
{
    EXPECT_ERRC(ledger->posts().createSuit(alice, "", {}),
                Errc::EMPTY_CONTENT);
    EXPECT_ERRC(ledger->posts().createSuit(alice, std::string(281, 'a'), {}),
                Errc::CONTENT_TOO_LONG);
    EXPECT_TRUE(ledger->posts().createSuit(alice, std::string(280, 'a'), {}));

    // 280 two-byte characters
    std::string wide;
    for(int i = 0; i < 280; i++)
    {
        wide += "\xc3\xa9";
    }
    EXPECT_TRUE(ledger->posts().createSuit(alice, wide, {}));
    EXPECT_ERRC(ledger->posts().createSuit(alice, wide + "a", {}),
                Errc::CONTENT_TOO_LONG);
    EXPECT_ERRC(ledger->posts().createSuit(alice, "\xc3", {}),
                Errc::INVALID_INPUT);

    ASSIGN_OR_FAIL(uint64_t total, ledger->posts().totalSuits());
    EXPECT_EQ(total, 2u);
}

TEST_F(SuitsTest, PreviewIsTruncated)
{
    std::string content;
    for(int i = 0; i < 150; i++)
    {
        content += "\xe4\xb8\xad";
    }
    ASSERT_TRUE(ledger->posts().createSuit(alice, content, {}));
    auto created = eventsOfType(Event::POST_CREATED);
    ASSERT_EQ(created.size(), 1u);
    auto preview = created[0].data["content_preview"].get<std::string>();
    EXPECT_EQ(utf8Length(preview), PREVIEW_LENGTH);
    EXPECT_TRUE(content.starts_with(preview));
}

TEST_F(SuitsTest, RecentIsNewestFirst)
{
    auto ids = createSuits(5);
    ASSERT_EQ(ids.size(), 5u);

    ASSIGN_OR_FAIL(auto recent, ledger->posts().getRecent(20, 0));
    EXPECT_EQ(recent, (std::vector<ObjectID>{ids[4], ids[3], ids[2], ids[1],
                                             ids[0]}));

    ASSIGN_OR_FAIL(auto page, ledger->posts().getRecent(2, 1));
    EXPECT_EQ(page, (std::vector<ObjectID>{ids[3], ids[2]}));

    ASSIGN_OR_FAIL(auto tail, ledger->posts().getRecent(10, 3));
    EXPECT_EQ(tail, (std::vector<ObjectID>{ids[1], ids[0]}));
}

TEST_F(SuitsTest, RecentAtTheBoundaries)
{
    ASSIGN_OR_FAIL(auto none, ledger->posts().getRecent(20, 0));
    EXPECT_TRUE(none.empty());

    auto ids = createSuits(5);
    ASSIGN_OR_FAIL(auto far, ledger->posts().getRecent(20, 10));
    EXPECT_TRUE(far.empty());
    ASSIGN_OR_FAIL(auto exact, ledger->posts().getRecent(20, 5));
    EXPECT_TRUE(exact.empty());
    ASSIGN_OR_FAIL(auto last, ledger->posts().getRecent(20, 4));
    EXPECT_EQ(last, (std::vector<ObjectID>{ids[0]}));
    ASSIGN_OR_FAIL(auto zero, ledger->posts().getRecent(0, 0));
    EXPECT_TRUE(zero.empty());
    ASSIGN_OR_FAIL(auto huge, ledger->posts().getRecent(
        std::numeric_limits<uint64_t>::max(),
        std::numeric_limits<uint64_t>::max()));
    EXPECT_TRUE(huge.empty());
    ASSIGN_OR_FAIL(auto all, ledger->posts().getRecent(
        std::numeric_limits<uint64_t>::max(), 0));
    EXPECT_EQ(all.size(), 5u);
}

TEST_F(SuitsTest, CanListByCreator)
{
    ASSIGN_OR_FAIL(Suit a1, ledger->posts().createSuit(alice, "a1", {}));
    ASSIGN_OR_FAIL(Suit b1, ledger->posts().createSuit(bob, "b1", {}));
    ASSIGN_OR_FAIL(Suit a2, ledger->posts().createSuit(alice, "a2", {}));

    ASSIGN_OR_FAIL(auto by_alice, ledger->posts().getByCreator(alice));
    EXPECT_EQ(by_alice, (std::vector<ObjectID>{a1.id, a2.id}));
    ASSIGN_OR_FAIL(auto by_bob, ledger->posts().getByCreator(bob));
    EXPECT_EQ(by_bob, (std::vector<ObjectID>{b1.id}));
    ASSIGN_OR_FAIL(auto by_carol, ledger->posts().getByCreator(carol));
    EXPECT_TRUE(by_carol.empty());
}

TEST_F(SuitsTest, DecrementsStopAtZero)
{
    ASSIGN_OR_FAIL(Suit s, ledger->posts().createSuit(alice, "hi", {}));
    ASSERT_TRUE(ledger->posts().decrementLike(s.id));
    ASSERT_TRUE(ledger->posts().decrementRetweet(s.id));
    ASSERT_TRUE(ledger->posts().incrementLike(s.id));
    ASSERT_TRUE(ledger->posts().incrementComment(s.id));
    ASSERT_TRUE(ledger->posts().addTipAmount(s.id, 1500));

    ASSIGN_OR_FAIL(Suit stored, ledger->posts().getSuit(s.id));
    EXPECT_EQ(stored.like_count, 1);
    EXPECT_EQ(stored.retweet_count, 0);
    EXPECT_EQ(stored.comment_count, 1);
    EXPECT_EQ(stored.tip_total, 1500);
}

TEST_F(SuitsTest, TipTotalDoesNotOverflow)
{
    ASSIGN_OR_FAIL(Suit s, ledger->posts().createSuit(alice, "hi", {}));
    ASSERT_TRUE(ledger->posts().addTipAmount(
        s.id, std::numeric_limits<int64_t>::max() - 1));
    ASSERT_TRUE(ledger->posts().addTipAmount(s.id, 1));
    EXPECT_ERRC(ledger->posts().addTipAmount(s.id, 1), Errc::INVALID_AMOUNT);
    EXPECT_ERRC(ledger->posts().addTipAmount(s.id, -1), Errc::INVALID_AMOUNT);
    ASSIGN_OR_FAIL(Suit stored, ledger->posts().getSuit(s.id));
    EXPECT_EQ(stored.tip_total, std::numeric_limits<int64_t>::max());
}

TEST_F(SuitsTest, UnknownSuit)
{
    ASSIGN_OR_FAIL(ObjectID missing, ObjectID::fromStr("0xdead"));
    EXPECT_ERRC(ledger->posts().getSuit(missing), Errc::NOT_FOUND);
    EXPECT_ERRC(ledger->posts().creatorOf(missing), Errc::NOT_FOUND);
    EXPECT_ERRC(ledger->posts().incrementLike(missing), Errc::NOT_FOUND);
}
