#pragma once

#include <expected>
#include <string>
#include <string_view>

#include <mw/error.hpp>

// Every way an operation can abort. An aborted operation leaves no
// trace in the database.
enum class Errc
{
    INVALID_INPUT,
    INVALID_USERNAME,
    USERNAME_TAKEN,
    PROFILE_EXISTS,
    NOT_OWNER,
    NOT_FOUND,
    EMPTY_CONTENT,
    CONTENT_TOO_LONG,
    CANNOT_ACT_ON_OWN_POST,
    ALREADY_LIKED,
    ALREADY_RETWEETED,
    MISMATCHED_POST,
    EMPTY_COMMENT,
    BELOW_MINIMUM_TIP,
    SELF_TIP,
    BALANCE_OWNER_MISMATCH,
    ZERO_BALANCE,
    INSUFFICIENT_BALANCE,
    INVALID_AMOUNT,
    SELF_CHAT,
    NOT_PARTICIPANT,
    EMPTY_MESSAGE,
    INDEX_OUT_OF_RANGE,
    ALREADY_READ,
    STORAGE,
};

enum class ErrorKind
{
    INVALID_INPUT,
    CONFLICT,
    UNAUTHORIZED,
    NOT_FOUND,
    INSUFFICIENT_FUNDS,
    STORAGE,
};

struct Error
{
    Error(Errc c, std::string m) : code(c), msg(std::move(m)) {}
    // Anything coming out of libmw is a storage failure. This is
    // implicit so that ASSIGN_OR_RETURN and DO_OR_RETURN can forward
    // mw::E failures from functions returning E.
    Error(const mw::Error& e);

    ErrorKind kind() const;
    bool operator==(const Error& rhs) const = default;

    Errc code;
    std::string msg;
};

template<typename T>
using E = std::expected<T, Error>;

Error ledgerError(Errc code, std::string_view msg);
std::string errorMsg(const Error& e);
std::string_view errcName(Errc code);
std::string_view errorKindName(ErrorKind kind);
