#include <gtest/gtest.h>

#include <mw/error.hpp>

#include "error.hpp"

TEST(Error, CodesMapToKinds)
{
    EXPECT_EQ(ledgerError(Errc::INVALID_USERNAME, "").kind(),
              ErrorKind::INVALID_INPUT);
    EXPECT_EQ(ledgerError(Errc::BALANCE_OWNER_MISMATCH, "").kind(),
              ErrorKind::INVALID_INPUT);
    EXPECT_EQ(ledgerError(Errc::USERNAME_TAKEN, "").kind(),
              ErrorKind::CONFLICT);
    EXPECT_EQ(ledgerError(Errc::ALREADY_READ, "").kind(), ErrorKind::CONFLICT);
    EXPECT_EQ(ledgerError(Errc::SELF_TIP, "").kind(), ErrorKind::UNAUTHORIZED);
    EXPECT_EQ(ledgerError(Errc::NOT_PARTICIPANT, "").kind(),
              ErrorKind::UNAUTHORIZED);
    EXPECT_EQ(ledgerError(Errc::INDEX_OUT_OF_RANGE, "").kind(),
              ErrorKind::NOT_FOUND);
    EXPECT_EQ(ledgerError(Errc::ZERO_BALANCE, "").kind(),
              ErrorKind::INSUFFICIENT_FUNDS);
}

TEST(Error, StorageErrorsComeFromLibmw)
{
    Error e = mw::runtimeError("database is locked");
    EXPECT_EQ(e.code, Errc::STORAGE);
    EXPECT_EQ(e.kind(), ErrorKind::STORAGE);
    EXPECT_NE(e.msg.find("database is locked"), std::string::npos);
}

TEST(Error, MessageNamesTheCode)
{
    EXPECT_EQ(errorMsg(ledgerError(Errc::SELF_CHAT, "Cannot chat")),
              "SelfChat: Cannot chat");
    EXPECT_EQ(errorKindName(ErrorKind::INSUFFICIENT_FUNDS),
              "InsufficientFunds");
}
