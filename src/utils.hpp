#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using Bytes = std::vector<unsigned char>;

// Number of code points in “s”, or nullopt if “s” is not valid
// UTF-8. Overlong encodings and surrogates are rejected.
std::optional<size_t> utf8Length(std::string_view s);

// The first “n” code points of “s”. “S” must be valid UTF-8.
std::string utf8Prefix(std::string_view s, size_t n);

std::string hexEncode(std::span<const unsigned char> bytes);
std::string hexEncode(std::string_view bytes);
// Accepts upper and lower case digits. Returns nullopt on odd length
// or non-hex characters.
std::optional<Bytes> hexDecode(std::string_view hex);
