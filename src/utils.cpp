#include "utils.hpp"

#include <cstdint>

namespace {

// Length of the sequence introduced by “lead”, 0 if it cannot start
// one.
size_t sequenceLength(unsigned char lead)
{
    if(lead < 0x80) return 1;
    if(lead >= 0xc2 && lead <= 0xdf) return 2;
    if(lead >= 0xe0 && lead <= 0xef) return 3;
    if(lead >= 0xf0 && lead <= 0xf4) return 4;
    return 0;
}

int hexValue(char c)
{
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<size_t> utf8Length(std::string_view s)
{
    size_t count = 0;
    size_t i = 0;
    while(i < s.size())
    {
        auto lead = static_cast<unsigned char>(s[i]);
        size_t len = sequenceLength(lead);
        if(len == 0 || i + len > s.size())
        {
            return std::nullopt;
        }
        uint32_t cp = len == 1 ? lead : lead & (0xff >> (len + 1));
        for(size_t j = 1; j < len; j++)
        {
            auto cont = static_cast<unsigned char>(s[i + j]);
            if((cont & 0xc0) != 0x80)
            {
                return std::nullopt;
            }
            cp = (cp << 6) | (cont & 0x3f);
        }
        if((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
           (cp >= 0xd800 && cp <= 0xdfff) || cp > 0x10ffff)
        {
            return std::nullopt;
        }
        i += len;
        count++;
    }
    return count;
}

std::string utf8Prefix(std::string_view s, size_t n)
{
    size_t i = 0;
    while(i < s.size() && n > 0)
    {
        size_t len = sequenceLength(static_cast<unsigned char>(s[i]));
        i += len == 0 ? 1 : len;
        n--;
    }
    return std::string(s.substr(0, i));
}

std::string hexEncode(std::span<const unsigned char> bytes)
{
    constexpr char DIGITS[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for(unsigned char b : bytes)
    {
        result.push_back(DIGITS[b >> 4]);
        result.push_back(DIGITS[b & 0xf]);
    }
    return result;
}

std::string hexEncode(std::string_view bytes)
{
    return hexEncode(std::span<const unsigned char>(
        reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size()));
}

std::optional<Bytes> hexDecode(std::string_view hex)
{
    if(hex.size() % 2 != 0)
    {
        return std::nullopt;
    }
    Bytes result;
    result.reserve(hex.size() / 2);
    for(size_t i = 0; i < hex.size(); i += 2)
    {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if(hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        result.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return result;
}
