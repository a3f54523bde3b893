#include <gtest/gtest.h>

#include "ledger_fixture.hpp"
#include "profile.hpp"
#include "test_utils.hpp"

using ProfileTest = LedgerTest;

TEST_F(ProfileTest, CanCreateProfile)
{
    now = 4242;
    ASSIGN_OR_FAIL(Profile p, ledger->identity().createProfile(
        alice, "alice", "Hello", "https://example.com/a.png"));
    EXPECT_EQ(p.owner, alice);
    EXPECT_EQ(p.username, "alice");
    EXPECT_EQ(p.bio, "Hello");
    EXPECT_EQ(p.created_at, 4242);
    EXPECT_EQ(p.followers_count, 0);
    EXPECT_EQ(p.following_count, 0);

    ASSIGN_OR_FAIL(bool available,
                   ledger->identity().isUsernameAvailable("alice"));
    EXPECT_FALSE(available);
    ASSIGN_OR_FAIL(Address owner,
                   ledger->identity().getOwnerByUsername("alice"));
    EXPECT_EQ(owner, alice);

    ASSIGN_OR_FAIL(Profile stored, ledger->identity().getProfile(p.id));
    EXPECT_EQ(stored.username, "alice");
    EXPECT_EQ(stored.pfp_url, "https://example.com/a.png");
    ASSIGN_OR_FAIL(Profile by_owner, ledger->identity().getProfileByOwner(alice));
    EXPECT_EQ(by_owner.id, p.id);

    auto created = eventsOfType(Event::PROFILE_CREATED);
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0].data["username"], "alice");
    EXPECT_EQ(created[0].data["owner"], alice.str());
    EXPECT_EQ(created[0].data["profile_id"], p.id.str());
}

TEST_F(ProfileTest, UsernameLengthIsCheckedInCodePoints)
{
    EXPECT_ERRC(ledger->identity().createProfile(alice, "ab", "", ""),
                Errc::INVALID_USERNAME);
    EXPECT_ERRC(ledger->identity().createProfile(alice, "", "", ""),
                Errc::INVALID_USERNAME);
    EXPECT_ERRC(ledger->identity().createProfile(
                    alice, std::string(21, 'a'), "", ""),
                Errc::INVALID_USERNAME);
    // Three code points, six bytes
    EXPECT_TRUE(ledger->identity()
                .createProfile(alice, "\xc3\xa9\xc3\xa9\xc3\xa9", "", "")
                .has_value());
    EXPECT_TRUE(ledger->identity()
                .createProfile(bob, std::string(20, 'b'), "", "")
                .has_value());
    EXPECT_ERRC(ledger->identity().createProfile(carol, "ab\xff", "", ""),
                Errc::INVALID_USERNAME);
    EXPECT_ERRC(ledger->identity().createProfile(carol, "carol", "\xff", ""),
                Errc::INVALID_INPUT);
}

TEST_F(ProfileTest, UsernameCanOnlyBeTakenOnce)
{
    ASSERT_TRUE(ledger->identity().createProfile(alice, "alice", "", ""));
    EXPECT_ERRC(ledger->identity().createProfile(bob, "alice", "", ""),
                Errc::USERNAME_TAKEN);
    EXPECT_ERRC(ledger->identity().getProfileByOwner(bob), Errc::NOT_FOUND);
    EXPECT_EQ(eventsOfType(Event::PROFILE_CREATED).size(), 1u);
}

TEST_F(ProfileTest, OneProfilePerAddress)
{
    ASSERT_TRUE(ledger->identity().createProfile(alice, "alice", "", ""));
    EXPECT_ERRC(ledger->identity().createProfile(alice, "alice2", "", ""),
                Errc::PROFILE_EXISTS);
    // The failed call left the name free.
    ASSIGN_OR_FAIL(bool available,
                   ledger->identity().isUsernameAvailable("alice2"));
    EXPECT_TRUE(available);
}

TEST_F(ProfileTest, UnknownUsername)
{
    ASSIGN_OR_FAIL(bool available,
                   ledger->identity().isUsernameAvailable("nobody"));
    EXPECT_TRUE(available);
    EXPECT_ERRC(ledger->identity().getOwnerByUsername("nobody"),
                Errc::NOT_FOUND);
}

TEST_F(ProfileTest, CanRename)
{
    ASSIGN_OR_FAIL(Profile p, ledger->identity().createProfile(
        alice, "alice", "old bio", ""));
    now = 2000;
    ASSIGN_OR_FAIL(Profile updated, ledger->identity().updateProfile(
        alice, p.id, "alicia", "new bio", "pic"));
    EXPECT_EQ(updated.username, "alicia");
    EXPECT_EQ(updated.bio, "new bio");
    EXPECT_EQ(updated.created_at, p.created_at);

    ASSIGN_OR_FAIL(bool old_free,
                   ledger->identity().isUsernameAvailable("alice"));
    EXPECT_TRUE(old_free);
    ASSIGN_OR_FAIL(Address owner,
                   ledger->identity().getOwnerByUsername("alicia"));
    EXPECT_EQ(owner, alice);

    auto updates = eventsOfType(Event::PROFILE_UPDATED);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].data["old_username"], "alice");
    EXPECT_EQ(updates[0].data["username"], "alicia");
    EXPECT_EQ(updates[0].created_at, 2000);

    // The old name can be taken by someone else now.
    EXPECT_TRUE(ledger->identity().createProfile(bob, "alice", "", ""));
}

TEST_F(ProfileTest, UpdateWithSameUsernameOnlyChangesDetails)
{
    ASSIGN_OR_FAIL(Profile p, ledger->identity().createProfile(
        alice, "alice", "bio", ""));
    ASSIGN_OR_FAIL(Profile updated, ledger->identity().updateProfile(
        alice, p.id, "alice", "other bio", "pic"));
    EXPECT_EQ(updated.username, "alice");
    ASSIGN_OR_FAIL(Profile stored, ledger->identity().getProfile(p.id));
    EXPECT_EQ(stored.bio, "other bio");
    EXPECT_EQ(stored.pfp_url, "pic");
}

TEST_F(ProfileTest, FailedRenameChangesNothing)
{
    ASSIGN_OR_FAIL(Profile p, ledger->identity().createProfile(
        alice, "alice", "bio", ""));
    ASSERT_TRUE(ledger->identity().createProfile(bob, "bob", "", ""));

    EXPECT_ERRC(ledger->identity().updateProfile(alice, p.id, "bob", "x", ""),
                Errc::USERNAME_TAKEN);
    EXPECT_ERRC(ledger->identity().updateProfile(alice, p.id, "x", "x", ""),
                Errc::INVALID_USERNAME);

    ASSIGN_OR_FAIL(Profile stored, ledger->identity().getProfile(p.id));
    EXPECT_EQ(stored.username, "alice");
    EXPECT_EQ(stored.bio, "bio");
    ASSIGN_OR_FAIL(Address owner,
                   ledger->identity().getOwnerByUsername("alice"));
    EXPECT_EQ(owner, alice);
    EXPECT_TRUE(eventsOfType(Event::PROFILE_UPDATED).empty());
}

TEST_F(ProfileTest, OnlyOwnerMayUpdate)
{
    ASSIGN_OR_FAIL(Profile p, ledger->identity().createProfile(
        alice, "alice", "bio", ""));
    EXPECT_ERRC(ledger->identity().updateProfile(bob, p.id, "bob", "", ""),
                Errc::NOT_OWNER);
    ASSIGN_OR_FAIL(ObjectID missing, ObjectID::fromStr("0xdead"));
    EXPECT_ERRC(ledger->identity().updateProfile(alice, missing, "a", "", ""),
                Errc::NOT_FOUND);
}
