#include <algorithm>
#include <expected>
#include <format>
#include <string>
#include <string_view>

#include "types.hpp"
#include "utils.hpp"

namespace {

E<std::array<unsigned char, ID_LENGTH>> parseId(std::string_view s,
                                                std::string_view what)
{
    std::string_view digits = s;
    if(digits.starts_with("0x") || digits.starts_with("0X"))
    {
        digits.remove_prefix(2);
    }
    if(digits.empty() || digits.size() > ID_LENGTH * 2)
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_INPUT, std::format("Invalid {}: {}", what, s)));
    }
    std::string padded(ID_LENGTH * 2 - digits.size(), '0');
    padded += digits;
    auto bytes = hexDecode(padded);
    if(!bytes.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_INPUT, std::format("Invalid {}: {}", what, s)));
    }
    std::array<unsigned char, ID_LENGTH> result;
    std::copy(bytes->begin(), bytes->end(), result.begin());
    return result;
}

} // namespace

E<Address> Address::fromStr(std::string_view s)
{
    Address a;
    ASSIGN_OR_RETURN(a.bytes, parseId(s, "address"));
    return a;
}

std::string Address::str() const
{
    return "0x" + hexEncode(bytes);
}

E<ObjectID> ObjectID::fromStr(std::string_view s)
{
    ObjectID id;
    ASSIGN_OR_RETURN(id.bytes, parseId(s, "object ID"));
    return id;
}

ObjectID ObjectID::fromBytes(std::span<const unsigned char, ID_LENGTH> b)
{
    ObjectID id;
    std::copy(b.begin(), b.end(), id.bytes.begin());
    return id;
}

std::string ObjectID::str() const
{
    return "0x" + hexEncode(bytes);
}

std::string interactionKey(Reaction::Kind kind, const ObjectID& suit,
                           const Address& actor)
{
    Bytes key;
    key.reserve(1 + ID_LENGTH * 2);
    key.push_back(static_cast<unsigned char>(kind));
    key.insert(key.end(), suit.bytes.begin(), suit.bytes.end());
    key.insert(key.end(), actor.bytes.begin(), actor.bytes.end());
    return hexEncode(key);
}

std::string chatKey(const Address& a, const Address& b)
{
    const Address& first = std::min(a, b);
    const Address& second = std::max(a, b);
    Bytes key;
    key.reserve(ID_LENGTH * 2);
    key.insert(key.end(), first.bytes.begin(), first.bytes.end());
    key.insert(key.end(), second.bytes.begin(), second.bytes.end());
    return hexEncode(key);
}
