#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rootsave::util {

std::string HexEncode(std::span<const std::uint8_t> data);

// Lowercase hex with a leading "0x", the form used for keys, addresses and
// transaction hashes.
std::string HexEncodePrefixed(std::span<const std::uint8_t> data);

// Strict decoder: even length, [0-9a-fA-F] only, no prefix.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

// Requires the "0x"/"0X" prefix, then decodes the remainder strictly.
bool HexDecodePrefixed(std::string_view hex, std::vector<std::uint8_t>* out);

// True when `text` is "0x" followed by exactly `byte_count * 2` lowercase
// hex digits.
bool IsCanonicalPrefixedHex(std::string_view text, std::size_t byte_count);

}  // namespace rootsave::util
