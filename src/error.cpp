#include "error.hpp"

#include <format>

Error::Error(const mw::Error& e) : code(Errc::STORAGE), msg(mw::errorMsg(e))
{
}

ErrorKind Error::kind() const
{
    switch(code)
    {
    case Errc::USERNAME_TAKEN:
    case Errc::PROFILE_EXISTS:
    case Errc::ALREADY_LIKED:
    case Errc::ALREADY_RETWEETED:
    case Errc::ALREADY_READ:
        return ErrorKind::CONFLICT;
    case Errc::NOT_OWNER:
    case Errc::NOT_PARTICIPANT:
    case Errc::CANNOT_ACT_ON_OWN_POST:
    case Errc::SELF_TIP:
    case Errc::SELF_CHAT:
        return ErrorKind::UNAUTHORIZED;
    case Errc::NOT_FOUND:
    case Errc::INDEX_OUT_OF_RANGE:
        return ErrorKind::NOT_FOUND;
    case Errc::ZERO_BALANCE:
    case Errc::INSUFFICIENT_BALANCE:
        return ErrorKind::INSUFFICIENT_FUNDS;
    case Errc::STORAGE:
        return ErrorKind::STORAGE;
    default:
        return ErrorKind::INVALID_INPUT;
    }
}

Error ledgerError(Errc code, std::string_view msg)
{
    return Error(code, std::string(msg));
}

std::string errorMsg(const Error& e)
{
    return std::format("{}: {}", errcName(e.code), e.msg);
}

std::string_view errcName(Errc code)
{
    switch(code)
    {
    case Errc::INVALID_INPUT: return "InvalidInput";
    case Errc::INVALID_USERNAME: return "InvalidUsername";
    case Errc::USERNAME_TAKEN: return "UsernameTaken";
    case Errc::PROFILE_EXISTS: return "ProfileExists";
    case Errc::NOT_OWNER: return "NotOwner";
    case Errc::NOT_FOUND: return "NotFound";
    case Errc::EMPTY_CONTENT: return "EmptyContent";
    case Errc::CONTENT_TOO_LONG: return "ContentTooLong";
    case Errc::CANNOT_ACT_ON_OWN_POST: return "CannotActOnOwnPost";
    case Errc::ALREADY_LIKED: return "AlreadyLiked";
    case Errc::ALREADY_RETWEETED: return "AlreadyRetweeted";
    case Errc::MISMATCHED_POST: return "MismatchedPost";
    case Errc::EMPTY_COMMENT: return "EmptyComment";
    case Errc::BELOW_MINIMUM_TIP: return "BelowMinimumTip";
    case Errc::SELF_TIP: return "SelfTip";
    case Errc::BALANCE_OWNER_MISMATCH: return "BalanceOwnerMismatch";
    case Errc::ZERO_BALANCE: return "ZeroBalance";
    case Errc::INSUFFICIENT_BALANCE: return "InsufficientBalance";
    case Errc::INVALID_AMOUNT: return "InvalidAmount";
    case Errc::SELF_CHAT: return "SelfChat";
    case Errc::NOT_PARTICIPANT: return "NotParticipant";
    case Errc::EMPTY_MESSAGE: return "EmptyMessage";
    case Errc::INDEX_OUT_OF_RANGE: return "IndexOutOfRange";
    case Errc::ALREADY_READ: return "AlreadyRead";
    case Errc::STORAGE: return "Storage";
    }
    return "Unknown";
}

std::string_view errorKindName(ErrorKind kind)
{
    switch(kind)
    {
    case ErrorKind::INVALID_INPUT: return "InvalidInput";
    case ErrorKind::CONFLICT: return "Conflict";
    case ErrorKind::UNAUTHORIZED: return "Unauthorized";
    case ErrorKind::NOT_FOUND: return "NotFound";
    case ErrorKind::INSUFFICIENT_FUNDS: return "InsufficientFunds";
    case ErrorKind::STORAGE: return "Storage";
    }
    return "Unknown";
}
